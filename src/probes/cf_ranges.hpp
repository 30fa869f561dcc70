#pragma once
#include <atomic>
#include <istream>
#include <mutex>
#include <string>
#include <vector>

#include "../net/cidr.hpp"
#include "../net/http_client.hpp"

namespace cscan {
using Ranges = std::vector<Cidr>;

enum class RangePhase { Uninitialized, Populated, Failed };

const char* range_phase_name(RangePhase p);

constexpr const char* kCloudFlareIpv4Url = "https://www.cloudflare.com/ips-v4";
constexpr const char* kCloudFlareIpv6Url = "https://www.cloudflare.com/ips-v6";

// Published CloudFlare ranges, downloaded once and kept for the life of the object.
// The first call to get_ranges() fetches both lists; its outcome, success or failure,
// is what every later call sees. Concurrent first calls are serialized so only one
// fetch is ever issued.
class RangeCache {
   public:
    RangeCache(HttpClient& client, std::string ipv4_url = kCloudFlareIpv4Url,
               std::string ipv6_url = kCloudFlareIpv6Url);

    // Returns null and the remembered error if the fetch failed.
    const Ranges* get_ranges(std::string& err);
    RangePhase phase() const;

   private:
    HttpClient& client_;
    std::string ipv4_url_;
    std::string ipv6_url_;

    std::mutex mu_;
    std::atomic<bool> settled_{false};
    RangePhase phase_{RangePhase::Uninitialized};
    Ranges ranges_;
    std::string error_;

    bool fetch(Ranges& out, std::string& err);
};

// Appends every CIDR line of body to out. Blank lines are skipped.
bool scan_cidr_lines(std::istream& body, Ranges& out, std::string& err);
}  // namespace cscan
