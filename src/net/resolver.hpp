#pragma once
#include <string>
#include <vector>

namespace cscan {
class Resolver {
   public:
    virtual ~Resolver() = default;
    // Fills addrs with the textual addresses of host. Returns false with err on resolver failure.
    virtual bool lookup_host(const std::string& host, std::vector<std::string>& addrs,
                             std::string& err) = 0;
};

// Platform resolver (getaddrinfo), IPv4 and IPv6 in resolver order without duplicates.
class SystemResolver : public Resolver {
   public:
    bool lookup_host(const std::string& host, std::vector<std::string>& addrs,
                     std::string& err) override;
};
}  // namespace cscan
