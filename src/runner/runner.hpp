#pragma once
#include <string>
#include <vector>

#include "../core/event_bus.hpp"
#include "../probes/probe.hpp"

namespace cscan {
struct RunSummary {
    size_t total{0};
    size_t good{0};
    size_t bad{0};
    size_t skipped{0};
    size_t errors{0};

    // Bad grades and errors fail a run; Skipped does not.
    bool passed() const {
        return bad == 0 && errors == 0;
    }
};

class Runner {
   public:
    Runner(EventBus& bus, const std::string& run_id);
    // Runs probe_names (every probe of family when empty) against each host, emitting one
    // ResultEvent per run. parallel runs each probe/host pair on its own thread.
    bool run(const Family& family, const std::vector<std::string>& probe_names,
             const std::vector<std::string>& hosts, bool parallel, RunSummary& summary,
             std::string& err);

   private:
    struct Job {
        std::string host;
        std::string probe_name;
        const Probe* probe;
        ProbeResult result;
    };

    EventBus& bus_;
    std::string run_id_;
    void run_job(const Family& family, Job& job);
};
}  // namespace cscan
