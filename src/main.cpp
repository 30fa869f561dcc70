#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

#include "core/config.hpp"
#include "core/console_sink.hpp"
#include "core/event_bus.hpp"
#include "core/logger.hpp"
#include "core/store_jsonl.hpp"
#include "core/uuid.hpp"
#include "net/dialer.hpp"
#include "net/http_client.hpp"
#include "net/resolver.hpp"
#include "probes/cf_ranges.hpp"
#include "probes/connectivity.hpp"
#include "runner/runner.hpp"

using namespace cscan;

namespace {
HttpClientOptions http_options(const ScanConfig& cfg) {
    HttpClientOptions opts;
    opts.timeout_ms = cfg.http_timeout_ms;
    opts.connect_timeout_ms = cfg.http_timeout_ms;
    opts.ca_file = cfg.ca_file;
    return opts;
}

TlsConfigFactory tls_factory(const ScanConfig& cfg) {
    std::string ca_file = cfg.ca_file;
    return [ca_file](const std::string& host) {
        TlsConfig tls = default_tls_config(host);
        tls.ca_file = ca_file;
        return tls;
    };
}
}  // namespace

static int cmd_list(const Family& family) {
    std::cout << family.name << ": " << family.description << "\n";
    for (const auto& name : family.names()) {
        std::cout << "  " << name << " - " << family.find(name)->description << "\n";
    }
    return 0;
}

static int cmd_doctor(RangeCache& ranges) {
    std::cout << "Doctor checks:\n";
    if (std::filesystem::exists("/etc/resolv.conf"))
        std::cout << " - resolv.conf: ok\n";
    else
        std::cout << " - resolv.conf missing\n";
    std::string err;
    const Ranges* nets = ranges.get_ranges(err);
    if (nets)
        std::cout << " - CloudFlare ranges: " << nets->size() << " loaded\n";
    else
        std::cout << " - CloudFlare ranges: unavailable (" << err << ")\n";
    return nets ? 0 : 1;
}

static int cmd_run(const ScanConfig& cfg, const Family& family) {
    if (cfg.hosts.empty()) {
        std::cerr << "run: at least one host is required\n";
        return 2;
    }
    EventBus bus;
    ConsoleSink console(std::cout);
    bus.add_sink(&console);
    std::unique_ptr<JsonlStore> store;
    if (!cfg.out_path.empty()) {
        store.reset(new JsonlStore(cfg.out_path));
        if (!store->is_open()) return 1;
        bus.add_sink(store.get());
    }

    Runner runner(bus, uuid4());
    RunSummary summary;
    std::string err;
    if (!runner.run(family, cfg.probes, cfg.hosts, cfg.parallel, summary, err)) {
        std::cerr << "run: " << err << "\n";
        return 2;
    }
    return summary.passed() ? 0 : 1;
}

static void print_usage() {
    std::cerr << "Usage: connscan <run|list|doctor> [options]\n"
              << "  run    [--probe <name>]... [--out <file.jsonl>] [--network tcp|tcp4|tcp6]\n"
              << "         [--timeout-ms <ms>] [--http-timeout-ms <ms>] [--ca-file <path>]\n"
              << "         [--cf-ipv4-url <url>] [--cf-ipv6-url <url>] [--parallel] [--verbose]\n"
              << "         <host[:port]>...\n"
              << "  list   (no args)\n"
              << "  doctor (no args)\n";
}

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);
    ScanConfig cfg;
    std::string cmd, err;
    if (!apply_env(cfg, err) || !parse_args(argc, argv, cfg, cmd, err)) {
        std::cerr << err << "\n";
        print_usage();
        return 2;
    }
    if (cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    if (cfg.verbose) set_log_level(LogLevel::DEBUG);

    SystemResolver resolver;
    DialerOptions dial_opts;
    dial_opts.timeout_ms = cfg.dial_timeout_ms;
    SocketDialer dialer(dial_opts);
    CurlHttpClient http(http_options(cfg));
    RangeCache cf_ranges(http, cfg.cf_ipv4_url, cfg.cf_ipv6_url);

    ScanEnv env{resolver, dialer, cf_ranges, cfg.network, tls_factory(cfg)};
    Family family = connectivity_family(env);

    if (cmd == "list") return cmd_list(family);
    if (cmd == "doctor") return cmd_doctor(cf_ranges);
    if (cmd == "run") return cmd_run(cfg, family);
    std::cerr << "Unknown command\n";
    print_usage();
    return 2;
}
