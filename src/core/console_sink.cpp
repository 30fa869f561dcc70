#include "console_sink.hpp"
#include <cstdio>

namespace cscan {
void ConsoleSink::on_event(const ResultEvent& ev) {
    out_ << ev.host << " " << ev.family << "/" << ev.probe << " " << ev.grade;
    if (!ev.error.empty())
        out_ << " error: " << ev.error;
    else if (ev.output_json != "null")
        out_ << " " << ev.output_json;
    char ms[32];
    std::snprintf(ms, sizeof(ms), "%.1f", ev.metric_ms);
    out_ << " (" << ms << " ms)\n";
    out_.flush();
}
}  // namespace cscan
