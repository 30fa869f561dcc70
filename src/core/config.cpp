#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace cscan {
namespace {
bool parse_positive(const std::string& text, const std::string& what, int& out, std::string& err) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size() || v <= 0) {
            err = "invalid " + what + ": " + text;
            return false;
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        err = "invalid " + what + ": " + text;
        return false;
    }
}
}  // namespace

bool valid_network(const std::string& network) {
    return network == "tcp" || network == "tcp4" || network == "tcp6";
}

bool apply_env(ScanConfig& cfg, std::string& err) {
    if (const char* v = std::getenv("CONNSCAN_NETWORK")) {
        if (!valid_network(v)) {
            err = std::string("invalid CONNSCAN_NETWORK: ") + v;
            return false;
        }
        cfg.network = v;
    }
    if (const char* v = std::getenv("CONNSCAN_TIMEOUT_MS")) {
        if (!parse_positive(v, "CONNSCAN_TIMEOUT_MS", cfg.dial_timeout_ms, err)) return false;
        cfg.http_timeout_ms = cfg.dial_timeout_ms;
    }
    if (const char* v = std::getenv("CONNSCAN_CA_FILE")) cfg.ca_file = v;
    return true;
}

bool parse_args(int argc, char** argv, ScanConfig& cfg, std::string& cmd, std::string& err) {
    if (argc < 2) {
        err = "missing command";
        return false;
    }
    cmd = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        bool has_value = i + 1 < argc;
        if (a == "--probe" && has_value) {
            cfg.probes.push_back(argv[++i]);
        } else if (a == "--out" && has_value) {
            cfg.out_path = argv[++i];
        } else if (a == "--network" && has_value) {
            cfg.network = argv[++i];
            if (!valid_network(cfg.network)) {
                err = "unknown network " + cfg.network;
                return false;
            }
        } else if (a == "--timeout-ms" && has_value) {
            if (!parse_positive(argv[++i], "--timeout-ms", cfg.dial_timeout_ms, err)) return false;
        } else if (a == "--http-timeout-ms" && has_value) {
            if (!parse_positive(argv[++i], "--http-timeout-ms", cfg.http_timeout_ms, err))
                return false;
        } else if (a == "--ca-file" && has_value) {
            cfg.ca_file = argv[++i];
        } else if (a == "--cf-ipv4-url" && has_value) {
            cfg.cf_ipv4_url = argv[++i];
        } else if (a == "--cf-ipv6-url" && has_value) {
            cfg.cf_ipv6_url = argv[++i];
        } else if (a == "--parallel") {
            cfg.parallel = true;
        } else if (a == "--verbose" || a == "-v") {
            cfg.verbose = true;
        } else if (!a.empty() && a[0] == '-') {
            err = "unknown option " + a;
            return false;
        } else {
            cfg.hosts.push_back(a);
        }
    }
    return true;
}
}  // namespace cscan
