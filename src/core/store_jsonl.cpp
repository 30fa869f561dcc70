#include "store_jsonl.hpp"
#include "json.hpp"
#include "logger.hpp"

namespace cscan {
JsonlStore::JsonlStore(const std::string& path) : out_(path, std::ios::app) {
    is_open_ = out_.is_open();
    if (!is_open_) {
        log(LogLevel::ERROR, "JsonlStore failed to open output file: " + path);
    }
}
JsonlStore::~JsonlStore() {
    if (is_open_) out_.flush();
}

void JsonlStore::write_json(const ResultEvent& ev) {
    if (!is_open_) return;
    out_ << "{";
    out_ << "\"run_id\":" << json_quote(ev.run_id) << ",";
    out_ << "\"ts_wall\":" << json_quote(ev.ts_wall) << ",";
    out_ << "\"family\":" << json_quote(ev.family) << ",";
    out_ << "\"probe\":" << json_quote(ev.probe) << ",";
    out_ << "\"host\":" << json_quote(ev.host) << ",";
    out_ << "\"result\":{\"grade\":" << json_quote(ev.grade) << ",\"output\":" << ev.output_json
         << ",\"error\":";
    if (ev.error.empty())
        out_ << "null";
    else
        out_ << json_quote(ev.error);
    out_ << ",\"metric_ms\":" << ev.metric_ms << "}";
    out_ << "}\n";
    out_.flush();
}

void JsonlStore::on_event(const ResultEvent& ev) { write_json(ev); }
}  // namespace cscan
