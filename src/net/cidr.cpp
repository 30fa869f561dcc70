#include "cidr.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <cstring>

namespace cscan {
namespace {
const uint8_t kV4MappedPrefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};

bool prefix_matches(const uint8_t* a, const uint8_t* b, int bits) {
    int full = bits / 8;
    if (std::memcmp(a, b, full) != 0) return false;
    int rem = bits % 8;
    if (rem == 0) return true;
    uint8_t mask = static_cast<uint8_t>(0xff << (8 - rem));
    return (a[full] & mask) == (b[full] & mask);
}
}  // namespace

std::string IpAddr::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    if (family != AF_INET && family != AF_INET6) return "invalid";
    if (!::inet_ntop(family, bytes.data(), buf, sizeof(buf))) return "invalid";
    return buf;
}

bool parse_ip(const std::string& text, IpAddr& out) {
    IpAddr ip;
    if (::inet_pton(AF_INET, text.c_str(), ip.bytes.data()) == 1) {
        ip.family = AF_INET;
        out = ip;
        return true;
    }
    if (::inet_pton(AF_INET6, text.c_str(), ip.bytes.data()) == 1) {
        if (std::memcmp(ip.bytes.data(), kV4MappedPrefix, sizeof(kV4MappedPrefix)) == 0) {
            IpAddr v4;
            v4.family = AF_INET;
            std::memcpy(v4.bytes.data(), ip.bytes.data() + 12, 4);
            out = v4;
            return true;
        }
        ip.family = AF_INET6;
        out = ip;
        return true;
    }
    return false;
}

Cidr::Cidr(const IpAddr& network, int prefix) : network_(network), prefix_(prefix) {
    int bits = static_cast<int>(network_.size()) * 8;
    for (int i = prefix_; i < bits; ++i) {
        network_.bytes[i / 8] &= static_cast<uint8_t>(~(0x80 >> (i % 8)));
    }
}

bool Cidr::contains(const IpAddr& ip) const {
    if (ip.family != network_.family) return false;
    return prefix_matches(ip.bytes.data(), network_.bytes.data(), prefix_);
}

std::string Cidr::to_string() const {
    return network_.to_string() + "/" + std::to_string(prefix_);
}

bool parse_cidr(const std::string& text, Cidr& out, std::string& err) {
    err = "invalid CIDR address: " + text;
    size_t slash = text.find('/');
    if (slash == std::string::npos) return false;
    std::string addr = text.substr(0, slash);
    std::string bits = text.substr(slash + 1);
    if (bits.empty() || bits.size() > 3) return false;
    for (char c : bits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    // "/08" is not a canonical prefix length
    if (bits.size() > 1 && bits[0] == '0') return false;
    int prefix = std::stoi(bits);

    IpAddr ip;
    if (::inet_pton(AF_INET, addr.c_str(), ip.bytes.data()) == 1) {
        ip.family = AF_INET;
    } else if (::inet_pton(AF_INET6, addr.c_str(), ip.bytes.data()) == 1) {
        ip.family = AF_INET6;
    } else {
        return false;
    }
    if (prefix > static_cast<int>(ip.size()) * 8) return false;
    out = Cidr(ip, prefix);
    err.clear();
    return true;
}
}  // namespace cscan
