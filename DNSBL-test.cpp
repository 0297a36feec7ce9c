#include "DNSBL.hpp"

#include "DNS-fake.hpp"

#include <glog/logging.h>

using DNSBL::Status;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  DNS::Fake_resolver res;
  res.add_a("sender.example", "192.0.2.7");
  res.add_a("7.2.0.192.zen.spamhaus.org", "127.0.0.4");
  res.fail(DNS::RR_type::A, "7.2.0.192.bl.spamcop.net");
  res.add_a("7.2.0.192.dnsbl.sorbs.net", "127.255.255.254");
  res.add_a("7.2.0.192.cbl.abuseat.org", "198.51.100.1");
  // pbl.spamhaus.org has nothing, NXDOMAIN

  auto const listings = DNSBL::check(res, "sender.example");
  CHECK_EQ(listings.size(), 5u);

  CHECK_EQ(listings[0].provider, "zen.spamhaus.org");
  CHECK(listings[0].status == Status::LISTED);
  CHECK_EQ(listings[0].return_code.value(), "127.0.0.4");
  CHECK_EQ(listings[0].address.value(), "192.0.2.7");
  CHECK_EQ(listings[0].domain, "sender.example");

  CHECK_EQ(listings[1].provider, "bl.spamcop.net");
  CHECK(listings[1].status == Status::UNKNOWN);

  CHECK_EQ(listings[2].provider, "dnsbl.sorbs.net");
  CHECK(listings[2].status == Status::UNKNOWN);

  CHECK_EQ(listings[3].provider, "cbl.abuseat.org");
  CHECK(listings[3].status == Status::UNKNOWN);

  CHECK_EQ(listings[4].provider, "pbl.spamhaus.org");
  CHECK(listings[4].status == Status::CLEAN);
  CHECK(!listings[4].return_code);

  CHECK(DNSBL::any_listed(listings));

  // An address is used as is.
  DNS::Fake_resolver clean;
  auto const by_ip = DNSBL::check(clean, "203.0.113.9");
  CHECK_EQ(by_ip.size(), 5u);
  for (auto const& l : by_ip) {
    CHECK(l.status == Status::CLEAN) << l.provider;
    CHECK_EQ(l.address.value(), "203.0.113.9");
  }
  CHECK(!DNSBL::any_listed(by_ip));
  CHECK_EQ(clean.queries(), 5);

  // No address, nothing to look up.
  DNS::Fake_resolver nothing;
  auto const unknown = DNSBL::check(nothing, "no-address.example");
  CHECK_EQ(unknown.size(), 5u);
  for (auto const& l : unknown) {
    CHECK(l.status == Status::UNKNOWN);
    CHECK(!l.address);
  }
  CHECK_EQ(nothing.queries(), 1);

  // Resolver that can't send a question at all.
  DNS::Fake_resolver down;
  down.unreachable("9.113.0.203.zen.spamhaus.org");
  std::optional<std::string> code;
  CHECK(DNSBL::query_zone(down, "9.113.0.203", "zen.spamhaus.org", code)
        == Status::UNKNOWN);
  CHECK(!code);

  CHECK_EQ(std::string{DNSBL::status_c_str(Status::LISTED)}, "listed");
}
