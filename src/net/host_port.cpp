#include "host_port.hpp"

namespace cscan {
namespace {
std::string addr_error(const std::string& addr, const std::string& why) {
    return "address " + addr + ": " + why;
}
}  // namespace

bool split_host_port(const std::string& hostport, std::string& host, std::string& port,
                     std::string& err) {
    size_t colon = hostport.rfind(':');
    if (colon == std::string::npos) {
        err = addr_error(hostport, "missing port in address");
        return false;
    }
    size_t host_begin = 0, host_end = colon;
    size_t open_from = 0, close_from = 0;
    if (!hostport.empty() && hostport[0] == '[') {
        size_t close = hostport.find(']');
        if (close == std::string::npos) {
            err = addr_error(hostport, "missing ']' in address");
            return false;
        }
        if (close + 1 == hostport.size()) {
            err = addr_error(hostport, "missing port in address");
            return false;
        }
        if (close + 1 != colon) {
            // "[::1]x:80" or "[::1]:80:90"
            err = addr_error(hostport, hostport[close + 1] == ':' ? "too many colons in address"
                                                                  : "missing port in address");
            return false;
        }
        host_begin = 1;
        host_end = close;
        open_from = 1;
        close_from = close + 1;
    } else if (hostport.find(':') != colon) {
        err = addr_error(hostport, "too many colons in address");
        return false;
    }
    if (hostport.find('[', open_from) != std::string::npos) {
        err = addr_error(hostport, "unexpected '[' in address");
        return false;
    }
    if (hostport.find(']', close_from) != std::string::npos) {
        err = addr_error(hostport, "unexpected ']' in address");
        return false;
    }
    host = hostport.substr(host_begin, host_end - host_begin);
    port = hostport.substr(colon + 1);
    return true;
}

bool strip_port(const std::string& input, std::string& host, std::string& err) {
    if (input.find(':') == std::string::npos) {
        host = input;
        return true;
    }
    if (input.size() > 2 && input.front() == '[' && input.back() == ']') {
        host = input.substr(1, input.size() - 2);
        return true;
    }
    std::string port;
    return split_host_port(input, host, port, err);
}
}  // namespace cscan
