#include <cassert>
#include <string>

#include "../src/net/cidr.hpp"

int main() {
    using namespace cscan;
    Cidr net;
    std::string err;
    IpAddr ip;

    assert(parse_cidr("1.1.1.0/24", net, err));
    assert(net.prefix() == 24);
    assert(parse_ip("1.1.1.1", ip) && net.contains(ip));
    assert(parse_ip("1.1.2.1", ip) && !net.contains(ip));
    assert(parse_ip("8.8.8.8", ip) && !net.contains(ip));

    // host bits are masked off
    assert(parse_cidr("173.245.48.17/20", net, err));
    assert(net.to_string() == "173.245.48.0/20");
    assert(parse_ip("173.245.63.255", ip) && net.contains(ip));
    assert(parse_ip("173.245.64.0", ip) && !net.contains(ip));

    assert(parse_cidr("2400:cb00::/32", net, err));
    assert(parse_ip("2400:cb00:2048:1::6814:55", ip) && net.contains(ip));
    assert(parse_ip("2001:db8::1", ip) && !net.contains(ip));
    assert(parse_ip("1.1.1.1", ip) && !net.contains(ip));

    // v4-mapped addresses compare as IPv4
    assert(parse_cidr("104.16.0.0/13", net, err));
    assert(parse_ip("::ffff:104.16.1.1", ip) && ip.family == AF_INET && net.contains(ip));

    assert(parse_cidr("0.0.0.0/0", net, err));
    assert(parse_ip("203.0.113.9", ip) && net.contains(ip));
    assert(parse_cidr("10.0.0.1/32", net, err));
    assert(parse_ip("10.0.0.1", ip) && net.contains(ip));
    assert(parse_ip("10.0.0.2", ip) && !net.contains(ip));

    assert(!parse_cidr("1.1.1.0", net, err));
    assert(err == "invalid CIDR address: 1.1.1.0");
    assert(!parse_cidr("1.1.1.0/33", net, err));
    assert(!parse_cidr("1.1.1.0/", net, err));
    assert(!parse_cidr("1.1.1.0/2a", net, err));
    assert(!parse_cidr("1.1.1.0/08", net, err));
    assert(!parse_cidr("not-a-range/8", net, err));
    assert(!parse_cidr("2400:cb00::/129", net, err));
    assert(!parse_ip("example.com", ip));
    return 0;
}
