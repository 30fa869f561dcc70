#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "../src/core/console_sink.hpp"
#include "../src/core/event_bus.hpp"
#include "../src/core/store_jsonl.hpp"

int main() {
    std::string path = "/tmp/connscan_test_events.jsonl";
    std::remove(path.c_str());
    {
        cscan::JsonlStore store(path);
        cscan::ResultEvent ev{"run",
                              "2024-01-01T00:00:00Z",
                              "Connectivity",
                              "CloudFlareStatus",
                              "example.com:443",
                              "Bad",
                              "{\"1.1.1.1\":true,\"8.8.8.8\":false}",
                              "",
                              12.5};
        store.on_event(ev);
        ev.probe = "TCPDial";
        ev.output_json = "null";
        ev.error = "dial tcp example.com:443: connect: \"refused\"";
        store.on_event(ev);
    }
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    if (line.find("\"probe\":\"CloudFlareStatus\"") == std::string::npos) return 1;
    if (line.find("\"output\":{\"1.1.1.1\":true,\"8.8.8.8\":false}") == std::string::npos) return 2;
    if (line.find("\"error\":null") == std::string::npos) return 3;
    std::getline(in, line);
    if (line.find("\"error\":\"dial tcp example.com:443: connect: \\\"refused\\\"\"") ==
        std::string::npos)
        return 4;

    cscan::JsonlStore missing("/nonexistent/dir/events.jsonl");
    if (missing.is_open()) return 5;

    std::ostringstream out;
    cscan::ConsoleSink console(out);
    cscan::EventBus bus;
    bus.add_sink(&console);
    cscan::ResultEvent ev;
    ev.host = "example.com:443";
    ev.family = "Connectivity";
    ev.probe = "DNSLookup";
    ev.grade = "Good";
    ev.output_json = "[\"93.184.216.34\"]";
    ev.metric_ms = 3.04;
    bus.emit(ev);
    if (out.str() != "example.com:443 Connectivity/DNSLookup Good [\"93.184.216.34\"] (3.0 ms)\n")
        return 6;
    return 0;
}
