#pragma once
#include <string>
#include <vector>

namespace cscan {
struct ScanConfig {
    std::string network{"tcp"};
    int dial_timeout_ms{60000};
    int http_timeout_ms{60000};
    std::string ca_file;
    std::string cf_ipv4_url{"https://www.cloudflare.com/ips-v4"};
    std::string cf_ipv6_url{"https://www.cloudflare.com/ips-v6"};
    std::string out_path;
    bool parallel{false};
    bool verbose{false};
    std::vector<std::string> probes;
    std::vector<std::string> hosts;
};

// Applies CONNSCAN_NETWORK, CONNSCAN_TIMEOUT_MS and CONNSCAN_CA_FILE when set.
bool apply_env(ScanConfig& cfg, std::string& err);

// Parses "<command> [options] [hosts]". Returns false with err set on a usage error.
bool parse_args(int argc, char** argv, ScanConfig& cfg, std::string& cmd, std::string& err);

bool valid_network(const std::string& network);
}  // namespace cscan
