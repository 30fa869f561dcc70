#include <cassert>
#include <string>

#include "../src/net/host_port.hpp"

int main() {
    using cscan::split_host_port;
    using cscan::strip_port;
    std::string host, port, err;

    assert(split_host_port("example.com:443", host, port, err));
    assert(host == "example.com" && port == "443");
    assert(split_host_port("[2001:db8::1]:8443", host, port, err));
    assert(host == "2001:db8::1" && port == "8443");
    assert(split_host_port(":80", host, port, err));
    assert(host.empty() && port == "80");

    assert(!split_host_port("example.com", host, port, err));
    assert(err.find("missing port") != std::string::npos);
    assert(!split_host_port("host:::bad", host, port, err));
    assert(err.find("too many colons") != std::string::npos);
    assert(!split_host_port("[::1:443", host, port, err));
    assert(err.find("missing ']'") != std::string::npos);
    assert(!split_host_port("[::1]:443:1", host, port, err));
    assert(!split_host_port("a[b:80", host, port, err));
    assert(err.find("unexpected '['") != std::string::npos);
    assert(!split_host_port("a]b:80", host, port, err));

    assert(strip_port("example.com", host, err) && host == "example.com");
    assert(strip_port("example.com:443", host, err) && host == "example.com");
    assert(strip_port("[::1]", host, err) && host == "::1");
    assert(strip_port("[::1]:443", host, err) && host == "::1");
    assert(!strip_port("host:::bad", host, err));
    return 0;
}
