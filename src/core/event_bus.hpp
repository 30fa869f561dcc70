#pragma once
#include <mutex>
#include <string>
#include <vector>

namespace cscan {
// One graded probe run against one host.
struct ResultEvent {
    std::string run_id;
    std::string ts_wall;
    std::string family;
    std::string probe;
    std::string host;
    std::string grade;
    std::string output_json{"null"};
    std::string error;
    double metric_ms{};
};

class EventSink {
   public:
    virtual ~EventSink() = default;
    virtual void on_event(const ResultEvent& ev) = 0;
};

class EventBus {
   public:
    void add_sink(EventSink* sink) {
        std::lock_guard<std::mutex> lock(mu_);
        sinks_.push_back(sink);
    }
    // Sinks are invoked under the bus lock, so they need no locking of their own.
    void emit(const ResultEvent& ev) {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto* s : sinks_) s->on_event(ev);
    }

   private:
    std::mutex mu_;
    std::vector<EventSink*> sinks_;
};
}  // namespace cscan
