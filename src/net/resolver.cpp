#include "resolver.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

namespace cscan {
namespace {
struct AddrinfoDeleter {
    void operator()(addrinfo* res) const {
        if (res) ::freeaddrinfo(res);
    }
};
}  // namespace

bool SystemResolver::lookup_host(const std::string& host, std::vector<std::string>& addrs,
                                 std::string& err) {
    if (host.empty()) {
        err = "lookup : no such host";
        return false;
    }
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    std::unique_ptr<addrinfo, AddrinfoDeleter> res(raw);
    if (rc != 0) {
        std::string why = rc == EAI_SYSTEM ? std::strerror(errno) : ::gai_strerror(rc);
        err = "lookup " + host + ": " + why;
        return false;
    }
    addrs.clear();
    for (addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        char ipbuf[INET6_ADDRSTRLEN] = {};
        const void* src = nullptr;
        if (ai->ai_family == AF_INET) {
            src = &reinterpret_cast<sockaddr_in*>(ai->ai_addr)->sin_addr;
        } else if (ai->ai_family == AF_INET6) {
            src = &reinterpret_cast<sockaddr_in6*>(ai->ai_addr)->sin6_addr;
        } else {
            continue;
        }
        if (!::inet_ntop(ai->ai_family, src, ipbuf, sizeof(ipbuf))) continue;
        std::string ip(ipbuf);
        if (std::find(addrs.begin(), addrs.end(), ip) == addrs.end()) addrs.push_back(ip);
    }
    return true;
}
}  // namespace cscan
