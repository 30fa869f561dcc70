#pragma once
#include <string>

#include "../net/dialer.hpp"
#include "../net/tls_config.hpp"
#include "probe.hpp"

namespace cscan {
// One TCP connect to host ("host:port"); the connection is closed straight away.
ProbeResult tcp_dial(Dialer& dialer, const std::string& network, const std::string& host);

// One TCP connect plus TLS handshake, using the configuration make_config builds for host.
ProbeResult tls_dial(Dialer& dialer, const std::string& network, const std::string& host,
                     const TlsConfigFactory& make_config);
}  // namespace cscan
