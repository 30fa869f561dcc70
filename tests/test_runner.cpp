#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "../src/core/event_bus.hpp"
#include "../src/probes/connectivity.hpp"
#include "../src/runner/runner.hpp"
#include "test_support.hpp"

using namespace cscan;

namespace {
class CollectingSink : public EventSink {
   public:
    std::vector<ResultEvent> events;
    void on_event(const ResultEvent& ev) override {
        events.push_back(ev);
    }
};
}  // namespace

int main() {
    cscan_test::FakeResolver resolver;
    resolver.answers["cf.example"] = {"104.16.1.1"};
    resolver.answers["other.example"] = {"104.16.1.1", "192.0.2.10"};
    cscan_test::FakeDialer dialer;
    cscan_test::FakeHttpClient http;
    http.bodies[kCloudFlareIpv4Url] = "104.16.0.0/13\n";
    http.bodies[kCloudFlareIpv6Url] = "";
    http.delay_ms = 20;
    RangeCache ranges(http);
    ScanEnv env{resolver, dialer, ranges};
    Family family = connectivity_family(env);

    EventBus bus;
    CollectingSink sink;
    bus.add_sink(&sink);
    Runner runner(bus, "run-1");

    RunSummary summary;
    std::string err;
    bool ok = runner.run(family, {}, {"cf.example:443"}, false, summary, err);
    assert(ok);
    assert(summary.total == 4 && summary.good == 4);
    assert(summary.passed());
    assert(sink.events.size() == 4);
    assert(sink.events[0].run_id == "run-1");
    assert(sink.events[0].family == "Connectivity");
    assert(sink.events[0].probe == "CloudFlareStatus");
    assert(sink.events[0].output_json == "{\"104.16.1.1\":true}");

    // all probes against two hosts at once share one range download
    sink.events.clear();
    summary = RunSummary{};
    ok = runner.run(family, {"CloudFlareStatus", "TCPDial"}, {"cf.example:443", "other.example:443"},
                    true, summary, err);
    assert(ok);
    assert(summary.total == 4);
    assert(summary.good == 3 && summary.bad == 1);
    assert(!summary.passed());
    assert(sink.events.size() == 4);
    assert(http.total_gets.load() == 2);

    dialer.fail_with = "dial tcp cf.example:443: connect: Connection refused";
    summary = RunSummary{};
    ok = runner.run(family, {"TCPDial"}, {"cf.example:443"}, false, summary, err);
    assert(ok);
    assert(summary.errors == 1 && !summary.passed());
    assert(sink.events.back().error == dialer.fail_with);
    assert(sink.events.back().grade == "Bad");

    summary = RunSummary{};
    ok = runner.run(family, {"NoSuchProbe"}, {"cf.example:443"}, false, summary, err);
    assert(!ok);
    assert(err == "unknown probe NoSuchProbe in family Connectivity");
    assert(summary.total == 0);
    return 0;
}
