#include "connectivity.hpp"

#include "cloudflare.hpp"
#include "dial.hpp"
#include "dns_lookup.hpp"

namespace cscan {
Family connectivity_family(const ScanEnv& env) {
    Resolver* resolver = &env.resolver;
    Dialer* dialer = &env.dialer;
    RangeCache* ranges = &env.cf_ranges;
    std::string network = env.network;
    TlsConfigFactory tls_config = env.tls_config;
    if (!tls_config) tls_config = default_tls_config;

    Family f;
    f.name = "Connectivity";
    f.description = "Scans for basic connectivity with the host through DNS and TCP/TLS dials";
    f.probes["DNSLookup"] = {"Host can be resolved through DNS", [resolver](const std::string& host) {
                                 return dns_lookup(*resolver, host);
                             }};
    f.probes["CloudFlareStatus"] = {"Host is on CloudFlare",
                                    [ranges, resolver](const std::string& host) {
                                        return cloudflare_status(*ranges, *resolver, host);
                                    }};
    f.probes["TCPDial"] = {"Host accepts TCP connection",
                           [dialer, network](const std::string& host) {
                               return tcp_dial(*dialer, network, host);
                           }};
    f.probes["TLSDial"] = {"Host can perform TLS handshake",
                           [dialer, network, tls_config](const std::string& host) {
                               return tls_dial(*dialer, network, host, tls_config);
                           }};
    return f;
}
}  // namespace cscan
