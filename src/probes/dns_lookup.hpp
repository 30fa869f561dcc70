#pragma once
#include <string>

#include "../net/resolver.hpp"
#include "probe.hpp"

namespace cscan {
// Resolves host (port optional, stripped first). Good with an AddressList when at least one
// address comes back.
ProbeResult dns_lookup(Resolver& resolver, const std::string& host);
}  // namespace cscan
