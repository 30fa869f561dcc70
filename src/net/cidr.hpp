#pragma once
#include <sys/socket.h>

#include <array>
#include <cstdint>
#include <string>

namespace cscan {
struct IpAddr {
    int family{AF_UNSPEC};
    std::array<uint8_t, 16> bytes{};  // IPv4 uses the first 4 bytes

    size_t size() const {
        return family == AF_INET ? 4 : 16;
    }
    std::string to_string() const;
};

// Parses textual IPv4/IPv6. IPv4-mapped IPv6 (::ffff:a.b.c.d) is normalized to IPv4.
bool parse_ip(const std::string& text, IpAddr& out);

class Cidr {
   public:
    Cidr() = default;
    Cidr(const IpAddr& network, int prefix);

    const IpAddr& network() const {
        return network_;
    }
    int prefix() const {
        return prefix_;
    }
    bool contains(const IpAddr& ip) const;
    std::string to_string() const;

   private:
    IpAddr network_;
    int prefix_{0};
};

// Parses "addr/prefix"; the stored network address is masked to the prefix.
bool parse_cidr(const std::string& text, Cidr& out, std::string& err);
}  // namespace cscan
