#include "probe.hpp"

#include <sstream>

#include "../core/json.hpp"

namespace cscan {
const char* grade_name(Grade g) {
    switch (g) {
        case Grade::Bad: return "Bad";
        case Grade::Good: return "Good";
        case Grade::Skipped: return "Skipped";
    }
    return "?";
}

std::string output_to_json(const Output& out) {
    std::ostringstream os;
    if (auto* list = std::get_if<AddressList>(&out)) {
        os << "[";
        for (size_t i = 0; i < list->size(); ++i) {
            if (i) os << ",";
            os << json_quote((*list)[i]);
        }
        os << "]";
    } else if (auto* membership = std::get_if<AddressMembership>(&out)) {
        os << "{";
        bool first = true;
        for (const auto& kv : *membership) {
            if (!first) os << ",";
            first = false;
            os << json_quote(kv.first) << ":" << (kv.second ? "true" : "false");
        }
        os << "}";
    } else {
        os << "null";
    }
    return os.str();
}

std::vector<std::string> Family::names() const {
    std::vector<std::string> out;
    out.reserve(probes.size());
    for (const auto& kv : probes) out.push_back(kv.first);
    return out;
}

const Probe* Family::find(const std::string& probe_name) const {
    auto it = probes.find(probe_name);
    return it == probes.end() ? nullptr : &it->second;
}
}  // namespace cscan
