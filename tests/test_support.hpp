#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include "../src/net/dialer.hpp"
#include "../src/net/http_client.hpp"
#include "../src/net/resolver.hpp"

namespace cscan_test {
class FakeResolver : public cscan::Resolver {
   public:
    std::map<std::string, std::vector<std::string>> answers;
    std::map<std::string, std::string> failures;
    std::atomic<int> calls{0};
    std::string last_host;

    bool lookup_host(const std::string& host, std::vector<std::string>& addrs,
                     std::string& err) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mu_);
            last_host = host;
        }
        auto f = failures.find(host);
        if (f != failures.end()) {
            err = f->second;
            return false;
        }
        auto it = answers.find(host);
        if (it == answers.end()) {
            err = "lookup " + host + ": no such host";
            return false;
        }
        addrs = it->second;
        return true;
    }

   private:
    std::mutex mu_;
};

// Stream buffer that hands out its text and then fails the read.
class FailingBuf : public std::streambuf {
   public:
    explicit FailingBuf(std::string text) : text_(std::move(text)) {
        setg(&text_[0], &text_[0], &text_[0] + text_.size());
    }

   protected:
    int_type underflow() override {
        throw std::ios_base::failure("connection reset");
    }

   private:
    std::string text_;
};

class FailingStream : public std::istream {
   public:
    explicit FailingStream(std::string text) : std::istream(nullptr), buf_(std::move(text)) {
        rdbuf(&buf_);
    }

   private:
    FailingBuf buf_;
};

class FakeHttpClient : public cscan::HttpClient {
   public:
    std::map<std::string, std::string> bodies;
    std::map<std::string, std::string> failures;
    std::map<std::string, std::string> broken_bodies;  // text served before a read error
    std::map<std::string, int> gets;
    std::atomic<int> total_gets{0};
    int delay_ms{0};

    std::unique_ptr<std::istream> get(const std::string& url, std::string& err) override {
        ++total_gets;
        {
            std::lock_guard<std::mutex> lock(mu_);
            ++gets[url];
        }
        if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        auto f = failures.find(url);
        if (f != failures.end()) {
            err = f->second;
            return nullptr;
        }
        auto b = broken_bodies.find(url);
        if (b != broken_bodies.end())
            return std::unique_ptr<std::istream>(new FailingStream(b->second));
        auto it = bodies.find(url);
        if (it == bodies.end()) {
            err = "Get " + url + ": 404 Not Found";
            return nullptr;
        }
        return std::unique_ptr<std::istream>(new std::istringstream(it->second));
    }

    int gets_for(const std::string& url) {
        std::lock_guard<std::mutex> lock(mu_);
        return gets[url];
    }

   private:
    std::mutex mu_;
};

class FakeConn : public cscan::Conn {
   public:
    explicit FakeConn(std::atomic<int>* closes) : closes_(closes) {}
    void close() override {
        if (!closed_) ++*closes_;
        closed_ = true;
    }

   private:
    std::atomic<int>* closes_;
    bool closed_{false};
};

class FakeDialer : public cscan::Dialer {
   public:
    std::string fail_with;  // empty: dials succeed
    std::atomic<int> dials{0};
    std::atomic<int> tls_dials{0};
    std::atomic<int> closes{0};
    std::string last_network;
    std::string last_address;
    cscan::TlsConfig last_tls;

    std::unique_ptr<cscan::Conn> dial(const std::string& network, const std::string& address,
                                      std::string& err) override {
        ++dials;
        record(network, address);
        if (!fail_with.empty()) {
            err = fail_with;
            return nullptr;
        }
        return std::unique_ptr<cscan::Conn>(new FakeConn(&closes));
    }

    std::unique_ptr<cscan::Conn> dial_tls(const std::string& network, const std::string& address,
                                          const cscan::TlsConfig& cfg, std::string& err) override {
        ++tls_dials;
        record(network, address);
        {
            std::lock_guard<std::mutex> lock(mu_);
            last_tls = cfg;
        }
        if (!fail_with.empty()) {
            err = fail_with;
            return nullptr;
        }
        return std::unique_ptr<cscan::Conn>(new FakeConn(&closes));
    }

   private:
    std::mutex mu_;

    void record(const std::string& network, const std::string& address) {
        std::lock_guard<std::mutex> lock(mu_);
        last_network = network;
        last_address = address;
    }
};
}  // namespace cscan_test
