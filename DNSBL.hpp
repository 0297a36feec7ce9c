#ifndef DNSBL_DOT_HPP
#define DNSBL_DOT_HPP

#include "DNS.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Config {
// clang-format off
constexpr char const* dnsbl_zones[]{
    "zen.spamhaus.org",
    "bl.spamcop.net",
    "dnsbl.sorbs.net",
    "cbl.abuseat.org",
    "pbl.spamhaus.org",
};
// clang-format on
} // namespace Config

namespace DNSBL {

enum class Status : uint8_t {
  CLEAN,
  LISTED,
  UNKNOWN,
};

constexpr char const* status_c_str(Status status)
{
  switch (status) {
  case Status::CLEAN: return "clean";
  case Status::LISTED: return "listed";
  case Status::UNKNOWN: return "unknown";
  }
  return "*** unknown Status ***";
}

struct Listing {
  std::string domain;
  std::string provider; // zone

  Status status{Status::UNKNOWN};

  std::optional<std::string> address;     // what was looked up
  std::optional<std::string> return_code; // A record from the zone

  std::chrono::system_clock::time_point last_checked;
};

// One entry per zone, in zone order; zones are queried concurrently.
std::vector<Listing> check(DNS::Resolver& res, std::string const& domain_or_ip);

// Look up a single reversed address in one zone.
Status query_zone(DNS::Resolver&              res,
                  std::string const&          reversed,
                  std::string const&          zone,
                  std::optional<std::string>& return_code);

bool any_listed(std::vector<Listing> const& listings);

} // namespace DNSBL

#endif // DNSBL_DOT_HPP
