#pragma once
#include <string>

#include "../net/resolver.hpp"
#include "cf_ranges.hpp"
#include "probe.hpp"

namespace cscan {
// Checks every resolved address of host against the CloudFlare ranges. Output is an
// AddressMembership; the grade is Good only when all addresses are inside a range.
// Skipped (with the cache's error) when the ranges are unavailable.
ProbeResult cloudflare_status(RangeCache& ranges, Resolver& resolver, const std::string& host);

// Membership of each address; true for the ones contained in some range.
AddressMembership range_membership(const Ranges& ranges, const AddressList& addrs);
}  // namespace cscan
