#pragma once
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cscan {
// Bad is the zero value: a failed probe that sets nothing else reports Bad.
enum class Grade { Bad, Good, Skipped };

const char* grade_name(Grade g);

using AddressList = std::vector<std::string>;
using AddressMembership = std::map<std::string, bool>;

// Probe-specific payload; interpreted according to the probe that produced it.
using Output = std::variant<std::monostate, AddressList, AddressMembership>;

std::string output_to_json(const Output& out);

struct ProbeResult {
    Grade grade{Grade::Bad};
    Output output;
    std::string error;  // empty on success

    bool ok() const {
        return error.empty();
    }
};

using ProbeFn = std::function<ProbeResult(const std::string& host)>;

struct Probe {
    std::string description;
    ProbeFn run;
};

struct Family {
    std::string name;
    std::string description;
    std::map<std::string, Probe> probes;

    std::vector<std::string> names() const;
    const Probe* find(const std::string& probe_name) const;
};
}  // namespace cscan
