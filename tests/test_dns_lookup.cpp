#include <cassert>
#include <string>

#include "../src/net/resolver.hpp"
#include "../src/probes/dns_lookup.hpp"
#include "test_support.hpp"

using namespace cscan;

int main() {
    cscan_test::FakeResolver resolver;
    resolver.answers["example.com"] = {"93.184.216.34", "2606:2800:220:1:248:1893:25c8:1946"};
    resolver.answers["empty.example"] = {};
    resolver.failures["nx.example"] = "lookup nx.example: Name or service not known";

    // port is stripped before resolution
    ProbeResult r = dns_lookup(resolver, "example.com:443");
    assert(r.ok());
    assert(r.grade == Grade::Good);
    assert(resolver.last_host == "example.com");
    const auto& addrs = std::get<AddressList>(r.output);
    assert(addrs.size() == 2);
    assert(addrs[0] == "93.184.216.34");

    r = dns_lookup(resolver, "example.com");
    assert(r.ok() && r.grade == Grade::Good);

    r = dns_lookup(resolver, "empty.example:443");
    assert(!r.ok());
    assert(r.error == "no addresses found for host");
    assert(r.grade == Grade::Bad);

    r = dns_lookup(resolver, "nx.example:80");
    assert(r.error == "lookup nx.example: Name or service not known");
    assert(r.grade == Grade::Bad);
    assert(std::holds_alternative<std::monostate>(r.output));

    // malformed input never reaches the resolver
    int before = resolver.calls.load();
    r = dns_lookup(resolver, "host:::bad");
    assert(!r.ok());
    assert(r.error.find("too many colons") != std::string::npos);
    assert(resolver.calls.load() == before);

    // the platform resolver answers numeric hosts without touching the network
    SystemResolver system;
    r = dns_lookup(system, "127.0.0.1:80");
    assert(r.ok());
    assert(std::get<AddressList>(r.output) == AddressList{"127.0.0.1"});
    return 0;
}
