#pragma once
#include <memory>
#include <string>

#include "tls_config.hpp"

namespace cscan {
// An established connection. Destroying it closes it.
class Conn {
   public:
    virtual ~Conn() = default;
    virtual void close() = 0;
};

class Dialer {
   public:
    virtual ~Dialer() = default;
    // network is "tcp", "tcp4" or "tcp6"; address is "host:port".
    virtual std::unique_ptr<Conn> dial(const std::string& network, const std::string& address,
                                       std::string& err) = 0;
    virtual std::unique_ptr<Conn> dial_tls(const std::string& network, const std::string& address,
                                           const TlsConfig& cfg, std::string& err) = 0;
};

struct DialerOptions {
    int timeout_ms{60000};  // whole dial, including the TLS handshake
};

// Blocking BSD-socket dialer with OpenSSL for TLS.
class SocketDialer : public Dialer {
   public:
    explicit SocketDialer(DialerOptions opts = {}) : opts_(opts) {}
    std::unique_ptr<Conn> dial(const std::string& network, const std::string& address,
                               std::string& err) override;
    std::unique_ptr<Conn> dial_tls(const std::string& network, const std::string& address,
                                   const TlsConfig& cfg, std::string& err) override;

   private:
    DialerOptions opts_;
};
}  // namespace cscan
