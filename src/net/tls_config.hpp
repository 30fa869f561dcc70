#pragma once
#include <functional>
#include <string>

namespace cscan {
struct TlsConfig {
    std::string server_name;  // SNI and, when verifying, the expected certificate name
    bool insecure_skip_verify{true};
    std::string ca_file;  // empty: system trust store
};

using TlsConfigFactory = std::function<TlsConfig(const std::string& host)>;

// Server name taken from host with any port removed; chain verification is left off.
TlsConfig default_tls_config(const std::string& host);
}  // namespace cscan
