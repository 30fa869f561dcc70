#include "dns_lookup.hpp"

#include "../net/host_port.hpp"

namespace cscan {
ProbeResult dns_lookup(Resolver& resolver, const std::string& host) {
    ProbeResult r;
    std::string bare;
    if (!strip_port(host, bare, r.error)) return r;

    AddressList addrs;
    if (!resolver.lookup_host(bare, addrs, r.error)) {
        if (r.error.empty()) r.error = "lookup " + bare + ": failed";
        return r;
    }
    if (addrs.empty()) {
        r.error = "no addresses found for host";
        return r;
    }
    r.grade = Grade::Good;
    r.output = std::move(addrs);
    return r;
}
}  // namespace cscan
