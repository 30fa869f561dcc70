#include "http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <sstream>
#include <utility>

#include "../core/logger.hpp"

namespace cscan {
namespace {
struct CurlDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct BodyBuffer {
    std::string* data;
    size_t max_bytes;
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buf = static_cast<BodyBuffer*>(userdata);
    size_t n = size * nmemb;
    if (buf->data->size() + n > buf->max_bytes) return 0;  // aborts with CURLE_WRITE_ERROR
    buf->data->append(ptr, n);
    return n;
}

bool ensure_global_init(std::string& err) {
    static std::once_flag once;
    static CURLcode rc = CURLE_OK;
    std::call_once(once, [] { rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (rc != CURLE_OK) {
        err = std::string("curl_global_init: ") + curl_easy_strerror(rc);
        return false;
    }
    return true;
}
}  // namespace

CurlHttpClient::CurlHttpClient(HttpClientOptions opts) : opts_(std::move(opts)) {}

std::unique_ptr<std::istream> CurlHttpClient::get(const std::string& url, std::string& err) {
    if (!ensure_global_init(err)) return nullptr;
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        err = "Get " + url + ": curl_easy_init failed";
        return nullptr;
    }
    std::string body;
    BodyBuffer buf{&body, opts_.max_body_bytes};
    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(opts_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(opts_.connect_timeout_ms));
    if (!opts_.ca_file.empty()) curl_easy_setopt(curl.get(), CURLOPT_CAINFO, opts_.ca_file.c_str());

    log(LogLevel::DEBUG, "GET " + url);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string why = errbuf[0] ? errbuf : curl_easy_strerror(res);
        if (res == CURLE_WRITE_ERROR) why = "response body exceeds limit";
        err = "Get " + url + ": " + why;
        return nullptr;
    }
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    log(LogLevel::DEBUG, "GET " + url + " -> " + std::to_string(status) + ", " +
                             std::to_string(body.size()) + " bytes");
    return std::unique_ptr<std::istream>(new std::istringstream(std::move(body)));
}
}  // namespace cscan
