#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace cscan {
inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

inline double elapsed_ms(uint64_t start_ns) {
    return (monotonic_ns() - start_ns) / 1e6;
}

inline std::string wall_time_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm_utc);
    return std::string(buf);
}
}  // namespace cscan
