#pragma once
#include <string>

#include "../net/dialer.hpp"
#include "../net/resolver.hpp"
#include "../net/tls_config.hpp"
#include "cf_ranges.hpp"
#include "probe.hpp"

namespace cscan {
// Collaborators shared by the connectivity probes. Must outlive the family built from it.
struct ScanEnv {
    Resolver& resolver;
    Dialer& dialer;
    RangeCache& cf_ranges;
    std::string network{"tcp"};
    TlsConfigFactory tls_config{default_tls_config};
};

// "Connectivity": DNSLookup, CloudFlareStatus, TCPDial and TLSDial.
Family connectivity_family(const ScanEnv& env);
}  // namespace cscan
