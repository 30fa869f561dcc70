#include "dial.hpp"

namespace cscan {
ProbeResult tcp_dial(Dialer& dialer, const std::string& network, const std::string& host) {
    ProbeResult r;
    std::unique_ptr<Conn> conn = dialer.dial(network, host, r.error);
    if (!conn) {
        if (r.error.empty()) r.error = "dial " + network + " " + host + ": failed";
        return r;
    }
    conn->close();
    r.grade = Grade::Good;
    return r;
}

ProbeResult tls_dial(Dialer& dialer, const std::string& network, const std::string& host,
                     const TlsConfigFactory& make_config) {
    ProbeResult r;
    std::unique_ptr<Conn> conn = dialer.dial_tls(network, host, make_config(host), r.error);
    if (!conn) {
        if (r.error.empty()) r.error = "tls handshake " + host + ": failed";
        return r;
    }
    conn->close();
    r.grade = Grade::Good;
    return r;
}
}  // namespace cscan
