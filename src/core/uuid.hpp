#pragma once
#include <cstdint>
#include <random>
#include <string>

namespace cscan {
// Random (version 4, RFC 4122 variant) identifier used as the run id of a scan.
inline std::string uuid4() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint8_t bytes[16];
    for (int i = 0; i < 16; i += 8) {
        uint64_t v = rng();
        for (int j = 0; j < 8; ++j) bytes[i + j] = static_cast<uint8_t>(v >> (j * 8));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += hex[bytes[i] >> 4];
        out += hex[bytes[i] & 0x0F];
    }
    return out;
}
}  // namespace cscan
