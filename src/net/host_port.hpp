#pragma once
#include <string>

namespace cscan {
// Splits "host:port" or "[v6host]:port". On failure err describes the malformed address.
bool split_host_port(const std::string& hostport, std::string& host, std::string& port,
                     std::string& err);

// Like split_host_port, but a bare host without any port is accepted as-is.
bool strip_port(const std::string& input, std::string& host, std::string& err);
}  // namespace cscan
