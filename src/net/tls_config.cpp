#include "tls_config.hpp"
#include "host_port.hpp"

namespace cscan {
TlsConfig default_tls_config(const std::string& host) {
    TlsConfig cfg;
    std::string err;
    if (!strip_port(host, cfg.server_name, err)) cfg.server_name = host;
    return cfg;
}
}  // namespace cscan
