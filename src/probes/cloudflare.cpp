#include "cloudflare.hpp"

#include "dns_lookup.hpp"

namespace cscan {
AddressMembership range_membership(const Ranges& ranges, const AddressList& addrs) {
    AddressMembership status;
    for (const auto& addr : addrs) {
        bool in_range = false;
        IpAddr ip;
        if (parse_ip(addr, ip)) {
            for (const auto& net : ranges) {
                if (net.contains(ip)) {
                    in_range = true;
                    break;
                }
            }
        }
        status[addr] = in_range;
    }
    return status;
}

ProbeResult cloudflare_status(RangeCache& ranges, Resolver& resolver, const std::string& host) {
    ProbeResult r;
    const Ranges* nets = ranges.get_ranges(r.error);
    if (!nets) {
        r.grade = Grade::Skipped;
        return r;
    }

    ProbeResult lookup = dns_lookup(resolver, host);
    if (!lookup.ok()) return lookup;

    // Every address is checked so the output names each one that is off CloudFlare.
    AddressMembership status = range_membership(*nets, std::get<AddressList>(lookup.output));
    r.grade = Grade::Good;
    for (const auto& kv : status) {
        if (!kv.second) r.grade = Grade::Bad;
    }
    r.output = std::move(status);
    return r;
}
}  // namespace cscan
