#include "dialer.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <cstring>

#include "../core/fd.hpp"
#include "../core/time_utils.hpp"
#include "host_port.hpp"

namespace cscan {
namespace {
struct AddrinfoDeleter {
    void operator()(addrinfo* res) const {
        if (res) ::freeaddrinfo(res);
    }
};
struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const {
        if (ctx) SSL_CTX_free(ctx);
    }
};
struct SslDeleter {
    void operator()(SSL* ssl) const {
        if (ssl) SSL_free(ssl);
    }
};
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

class SocketConn : public Conn {
   public:
    explicit SocketConn(Fd fd) : fd_(std::move(fd)) {}
    void close() override {
        fd_.reset();
    }

   private:
    Fd fd_;
};

class TlsConn : public Conn {
   public:
    TlsConn(SslCtxPtr ctx, SslPtr ssl, Fd fd)
        : ctx_(std::move(ctx)), ssl_(std::move(ssl)), fd_(std::move(fd)) {}
    ~TlsConn() override {
        close();
    }
    void close() override {
        if (ssl_) SSL_shutdown(ssl_.get());
        ssl_.reset();
        ctx_.reset();
        fd_.reset();
    }

   private:
    SslCtxPtr ctx_;
    SslPtr ssl_;
    Fd fd_;
};

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(in6_addr)];
    return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

int remaining_ms(uint64_t deadline_ns) {
    uint64_t now = monotonic_ns();
    if (now >= deadline_ns) return 0;
    return static_cast<int>((deadline_ns - now) / 1000000) + 1;
}

// Non-blocking connect to one resolved address, bounded by the deadline.
bool connect_one(const addrinfo* ai, uint64_t deadline_ns, Fd& out, std::string& why) {
    Fd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (!fd) {
        why = std::string("socket: ") + std::strerror(errno);
        return false;
    }
    if (!fd.set_blocking(false)) {
        why = std::string("fcntl: ") + std::strerror(errno);
        return false;
    }
    if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            why = std::string("connect: ") + std::strerror(errno);
            return false;
        }
        pollfd pfd{fd.get(), POLLOUT, 0};
        int rc;
        do {
            rc = ::poll(&pfd, 1, remaining_ms(deadline_ns));
        } while (rc < 0 && errno == EINTR);
        if (rc == 0) {
            why = "i/o timeout";
            return false;
        }
        if (rc < 0) {
            why = std::string("poll: ") + std::strerror(errno);
            return false;
        }
        int soerr = 0;
        socklen_t len = sizeof(soerr);
        if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &soerr, &len) < 0) soerr = errno;
        if (soerr != 0) {
            why = std::string("connect: ") + std::strerror(soerr);
            return false;
        }
    }
    if (!fd.set_blocking(true)) {
        why = std::string("fcntl: ") + std::strerror(errno);
        return false;
    }
    out = std::move(fd);
    return true;
}

bool connect_tcp(const std::string& network, const std::string& address, int timeout_ms,
                 Fd& out, std::string& err) {
    std::string prefix = "dial " + network + " " + address + ": ";
    int family;
    if (network == "tcp") {
        family = AF_UNSPEC;
    } else if (network == "tcp4") {
        family = AF_INET;
    } else if (network == "tcp6") {
        family = AF_INET6;
    } else {
        err = prefix + "unknown network " + network;
        return false;
    }
    std::string host, port, why;
    if (!split_host_port(address, host, port, why)) {
        err = prefix + why;
        return false;
    }
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &raw);
    std::unique_ptr<addrinfo, AddrinfoDeleter> res(raw);
    if (rc != 0) {
        err = prefix + "lookup " + host + ": " +
              (rc == EAI_SYSTEM ? std::strerror(errno) : ::gai_strerror(rc));
        return false;
    }
    uint64_t deadline = monotonic_ns() + static_cast<uint64_t>(timeout_ms) * 1000000ULL;
    why = "no suitable address found";
    for (const addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        if (connect_one(ai, deadline, out, why)) return true;
        if (remaining_ms(deadline) == 0) break;
    }
    err = prefix + why;
    return false;
}

void set_io_timeout(int fd, int ms) {
    timeval tv{};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}
}  // namespace

std::unique_ptr<Conn> SocketDialer::dial(const std::string& network, const std::string& address,
                                         std::string& err) {
    Fd fd;
    if (!connect_tcp(network, address, opts_.timeout_ms, fd, err)) return nullptr;
    return std::unique_ptr<Conn>(new SocketConn(std::move(fd)));
}

std::unique_ptr<Conn> SocketDialer::dial_tls(const std::string& network,
                                             const std::string& address, const TlsConfig& cfg,
                                             std::string& err) {
    uint64_t start = monotonic_ns();
    Fd fd;
    if (!connect_tcp(network, address, opts_.timeout_ms, fd, err)) return nullptr;
    std::string prefix = "tls handshake " + address + ": ";

    ERR_clear_error();
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        err = prefix + openssl_error();
        return nullptr;
    }
    if (cfg.insecure_skip_verify) {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    } else {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
        int ok = cfg.ca_file.empty()
                     ? SSL_CTX_set_default_verify_paths(ctx.get())
                     : SSL_CTX_load_verify_locations(ctx.get(), cfg.ca_file.c_str(), nullptr);
        if (ok != 1) {
            err = prefix + "loading trust store: " + openssl_error();
            return nullptr;
        }
    }
    SslPtr ssl(SSL_new(ctx.get()));
    if (!ssl) {
        err = prefix + openssl_error();
        return nullptr;
    }
    if (!cfg.server_name.empty() && !is_ip_literal(cfg.server_name)) {
        SSL_set_tlsext_host_name(ssl.get(), cfg.server_name.c_str());
    }
    if (!cfg.insecure_skip_verify && !cfg.server_name.empty()) {
        if (is_ip_literal(cfg.server_name))
            X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl.get()), cfg.server_name.c_str());
        else
            SSL_set1_host(ssl.get(), cfg.server_name.c_str());
    }

    int left = opts_.timeout_ms - static_cast<int>(elapsed_ms(start));
    if (left <= 0) {
        err = prefix + "i/o timeout";
        return nullptr;
    }
    set_io_timeout(fd.get(), left);
    SSL_set_fd(ssl.get(), fd.get());
    errno = 0;
    int rc = SSL_connect(ssl.get());
    int saved_errno = errno;
    if (rc != 1) {
        int ssl_err = SSL_get_error(ssl.get(), rc);
        long verify = SSL_get_verify_result(ssl.get());
        if (!cfg.insecure_skip_verify && verify != X509_V_OK) {
            err = prefix + "certificate verify failed: " + X509_verify_cert_error_string(verify);
        } else if (ssl_err == SSL_ERROR_SYSCALL &&
                   (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK)) {
            err = prefix + "i/o timeout";
        } else if (ssl_err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            err = prefix +
                  (saved_errno != 0 ? std::strerror(saved_errno) : "connection closed by peer");
        } else {
            err = prefix + openssl_error();
        }
        return nullptr;
    }
    set_io_timeout(fd.get(), 0);
    return std::unique_ptr<Conn>(new TlsConn(std::move(ctx), std::move(ssl), std::move(fd)));
}
}  // namespace cscan
