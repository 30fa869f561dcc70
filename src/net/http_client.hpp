#pragma once
#include <istream>
#include <memory>
#include <string>

namespace cscan {
class HttpClient {
   public:
    virtual ~HttpClient() = default;
    // GET url. Returns the response body, or null with err set on a transport failure.
    // Dropping the returned stream closes the body.
    virtual std::unique_ptr<std::istream> get(const std::string& url, std::string& err) = 0;
};

struct HttpClientOptions {
    int timeout_ms{60000};
    int connect_timeout_ms{60000};
    size_t max_body_bytes{4 * 1024 * 1024};
    std::string ca_file;
    std::string user_agent{"connscan/1.0"};
};

// libcurl easy-interface client. Redirects are followed; HTTP status >= 400 is a failure.
class CurlHttpClient : public HttpClient {
   public:
    explicit CurlHttpClient(HttpClientOptions opts = {});
    std::unique_ptr<std::istream> get(const std::string& url, std::string& err) override;

   private:
    HttpClientOptions opts_;
};
}  // namespace cscan
