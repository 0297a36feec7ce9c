#include "DNSBL.hpp"

#include "Errors.hpp"
#include "IP4.hpp"

#include <algorithm>
#include <future>

#include <glog/logging.h>

#include <fmt/format.h>

/*** Return codes, from <https://www.spamhaus.org/faq/section/DNSBL%20Usage>

127.0.0.2-11   listed, the last octet says on which list
127.255.255.252  typing error in DNSBL name
127.255.255.254  query via public/open resolver
127.255.255.255  excessive number of queries

The 127.255.255.0/24 codes mean "we did not answer your question", so
they are neither listed nor clean.
*/

namespace DNSBL {

Status query_zone(DNS::Resolver&              res,
                  std::string const&          reversed,
                  std::string const&          zone,
                  std::optional<std::string>& return_code)
{
  auto const name = fmt::format("{}.{}", reversed, zone);

  DNS::Answer answer;
  try {
    answer = res.query(DNS::RR_type::A, name);
  }
  catch (DnsLookupError const& e) {
    LOG(WARNING) << name << ": " << e.what();
    return Status::UNKNOWN;
  }

  if (answer.nx_domain)
    return Status::CLEAN;

  if (answer.bogus_or_indeterminate) {
    LOG(WARNING) << name << ": " << answer.error;
    return Status::UNKNOWN;
  }

  for (auto const& rr : answer.rrs) {
    if (!std::holds_alternative<DNS::RR_A>(rr))
      continue;
    std::string const code{std::get<DNS::RR_A>(rr).c_str()};
    return_code = code;

    if (IP4::is_dnsbl_refusal(code)) {
      LOG(INFO) << "query refused by " << zone << " (" << code << ")";
      return Status::UNKNOWN;
    }
    if (!IP4::is_loopback_net(code)) {
      // Some resolvers rewrite NXDOMAIN into an ad server address.
      LOG(WARNING) << zone << " returned " << code
                   << ", outside 127.0.0.0/8";
      return Status::UNKNOWN;
    }

    LOG(INFO) << reversed << " listed by " << zone << " (" << code << ")";
    return Status::LISTED;
  }

  // NOERROR with no A record, NODATA
  return Status::CLEAN;
}

namespace {
std::optional<std::string> address_of(DNS::Resolver&     res,
                                      std::string const& domain_or_ip)
{
  if (IP4::is_address(domain_or_ip))
    return domain_or_ip;

  try {
    auto const answer = res.query(DNS::RR_type::A, domain_or_ip);
    for (auto const& rr : answer.rrs) {
      if (std::holds_alternative<DNS::RR_A>(rr))
        return std::string{std::get<DNS::RR_A>(rr).c_str()};
    }
    if (answer.bogus_or_indeterminate)
      LOG(WARNING) << domain_or_ip << ": " << answer.error;
  }
  catch (DnsLookupError const& e) {
    LOG(WARNING) << domain_or_ip << ": " << e.what();
  }
  return {};
}
} // namespace

std::vector<Listing> check(DNS::Resolver& res, std::string const& domain_or_ip)
{
  auto const now  = std::chrono::system_clock::now();
  auto const addr = address_of(res, domain_or_ip);

  std::vector<Listing> listings;
  for (auto zone : Config::dnsbl_zones) {
    Listing l;
    l.domain       = domain_or_ip;
    l.provider     = zone;
    l.address      = addr;
    l.last_checked = now;
    listings.push_back(std::move(l));
  }

  if (!addr) {
    LOG(WARNING) << "no IPv4 address for " << domain_or_ip
                 << ", blacklist status unknown";
    return listings;
  }

  auto const reversed = IP4::reverse(*addr);

  std::vector<std::future<Status>> futures;
  for (auto& l : listings) {
    futures.push_back(std::async(std::launch::async, [&res, &reversed, &l] {
      return query_zone(res, reversed, l.provider, l.return_code);
    }));
  }

  for (size_t i = 0; i < listings.size(); ++i)
    listings[i].status = futures[i].get();

  auto const checked = std::chrono::system_clock::now();
  for (auto& l : listings)
    l.last_checked = checked;

  return listings;
}

bool any_listed(std::vector<Listing> const& listings)
{
  return std::any_of(begin(listings), end(listings), [](auto const& l) {
    return l.status == Status::LISTED;
  });
}

} // namespace DNSBL
