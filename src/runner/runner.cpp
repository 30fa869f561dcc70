#include "runner.hpp"

#include <thread>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"

namespace cscan {
Runner::Runner(EventBus& bus, const std::string& run_id) : bus_(bus), run_id_(run_id) {}

bool Runner::run(const Family& family, const std::vector<std::string>& probe_names,
                 const std::vector<std::string>& hosts, bool parallel, RunSummary& summary,
                 std::string& err) {
    std::vector<std::string> names = probe_names.empty() ? family.names() : probe_names;
    std::vector<Job> jobs;
    for (const auto& host : hosts) {
        for (const auto& name : names) {
            const Probe* p = family.find(name);
            if (!p) {
                err = "unknown probe " + name + " in family " + family.name;
                return false;
            }
            jobs.push_back({host, name, p, {}});
        }
    }

    if (parallel) {
        std::vector<std::thread> workers;
        workers.reserve(jobs.size());
        for (auto& job : jobs) workers.emplace_back([this, &family, &job] { run_job(family, job); });
        for (auto& w : workers) w.join();
    } else {
        for (auto& job : jobs) run_job(family, job);
    }

    for (const auto& job : jobs) {
        ++summary.total;
        if (!job.result.ok()) {
            // Skipped keeps its error but counts as inconclusive rather than failed.
            if (job.result.grade == Grade::Skipped)
                ++summary.skipped;
            else
                ++summary.errors;
            continue;
        }
        switch (job.result.grade) {
            case Grade::Good: ++summary.good; break;
            case Grade::Bad: ++summary.bad; break;
            case Grade::Skipped: ++summary.skipped; break;
        }
    }
    log(LogLevel::INFO, family.name + ": " + std::to_string(summary.total) + " results, " +
                            std::to_string(summary.good) + " good, " + std::to_string(summary.bad) +
                            " bad, " + std::to_string(summary.skipped) + " skipped, " +
                            std::to_string(summary.errors) + " errors");
    return true;
}

void Runner::run_job(const Family& family, Job& job) {
    log(LogLevel::DEBUG, "running " + family.name + "/" + job.probe_name + " on " + job.host);
    uint64_t start = monotonic_ns();
    job.result = job.probe->run(job.host);

    ResultEvent ev;
    ev.run_id = run_id_;
    ev.ts_wall = wall_time_iso8601();
    ev.family = family.name;
    ev.probe = job.probe_name;
    ev.host = job.host;
    ev.grade = grade_name(job.result.grade);
    ev.output_json = output_to_json(job.result.output);
    ev.error = job.result.error;
    ev.metric_ms = elapsed_ms(start);
    log(LogLevel::DEBUG, "finished " + job.probe_name + " on " + job.host + ": " + ev.grade);
    bus_.emit(ev);
}
}  // namespace cscan
