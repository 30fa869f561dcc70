#include "cf_ranges.hpp"

#include <memory>
#include <utility>

#include "../core/logger.hpp"

namespace cscan {
namespace {
constexpr size_t kMaxLineBytes = 64 * 1024;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}
}  // namespace

const char* range_phase_name(RangePhase p) {
    switch (p) {
        case RangePhase::Uninitialized: return "uninitialized";
        case RangePhase::Populated: return "populated";
        case RangePhase::Failed: return "failed";
    }
    return "?";
}

RangeCache::RangeCache(HttpClient& client, std::string ipv4_url, std::string ipv6_url)
    : client_(client), ipv4_url_(std::move(ipv4_url)), ipv6_url_(std::move(ipv6_url)) {}

const Ranges* RangeCache::get_ranges(std::string& err) {
    if (!settled_.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lock(mu_);
        if (!settled_.load(std::memory_order_relaxed)) {
            Ranges fetched;
            std::string fetch_err;
            if (fetch(fetched, fetch_err)) {
                ranges_ = std::move(fetched);
                phase_ = RangePhase::Populated;
                log(LogLevel::INFO, "loaded " + std::to_string(ranges_.size()) +
                                        " CloudFlare ranges");
            } else {
                error_ = std::move(fetch_err);
                phase_ = RangePhase::Failed;
            }
            settled_.store(true, std::memory_order_release);
        }
    }
    if (phase_ == RangePhase::Failed) {
        err = error_;
        return nullptr;
    }
    return &ranges_;
}

RangePhase RangeCache::phase() const {
    if (!settled_.load(std::memory_order_acquire)) return RangePhase::Uninitialized;
    return phase_;
}

bool RangeCache::fetch(Ranges& out, std::string& err) {
    std::string why;
    std::unique_ptr<std::istream> v4 = client_.get(ipv4_url_, why);
    if (!v4) {
        err = "Couldn't download CloudFlare IPs: " + why;
        return false;
    }
    std::unique_ptr<std::istream> v6 = client_.get(ipv6_url_, why);
    if (!v6) {
        err = "Couldn't download CloudFlare IPs: " + why;
        return false;
    }
    // Each body is scanned on its own, as if joined by a newline.
    if (!scan_cidr_lines(*v4, out, err) || !scan_cidr_lines(*v6, out, err)) return false;
    return true;
}

bool scan_cidr_lines(std::istream& body, Ranges& out, std::string& err) {
    std::string line;
    while (std::getline(body, line)) {
        if (line.size() > kMaxLineBytes) {
            err = "Couldn't read IP bodies: token too long";
            return false;
        }
        std::string text = trim(line);
        if (text.empty()) continue;
        Cidr net;
        std::string why;
        if (!parse_cidr(text, net, why)) {
            err = "Couldn't parse CIDR range: " + why;
            return false;
        }
        out.push_back(net);
    }
    if (body.bad()) {
        err = "Couldn't read IP bodies: read error";
        return false;
    }
    return true;
}
}  // namespace cscan
