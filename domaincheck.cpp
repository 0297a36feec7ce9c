// command line tool to check a sending domain's DNS setup and blacklists

#include "DNS-ldns.hpp"
#include "DNS-validate.hpp"
#include "DNSBL.hpp"

#include <iostream>
#include <optional>

#include <gflags/gflags.h>

DECLARE_string(smtp_host);

DEFINE_string(selector,
              Config::dkim_selector_default,
              "DKIM selector to look for");

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
void print_validation(DNS::Record_validation const& v)
{
  std::cout << fmt::format("{:5} {:7} {}\n", DNS::record_c_str(v.record),
                           v.is_valid ? "valid" : "INVALID",
                           v.current_value.value_or("(none)"));
  for (auto const& issue : v.issues)
    std::cout << "      " << issue << '\n';
}

void do_domain(DNS::Resolver& res, char const* domain)
{
  std::optional<std::string> smtp_host;
  if (!FLAGS_smtp_host.empty())
    smtp_host = FLAGS_smtp_host;

  auto const guide
      = DNS::validate_domain(res, domain, smtp_host, FLAGS_selector);

  std::cout << domain << " score " << guide.overall_score << "%\n";
  for (auto const* v : {&guide.spf, &guide.dkim, &guide.dmarc, &guide.mx})
    print_validation(*v);

  for (auto const& l : DNSBL::check(res, domain)) {
    std::cout << fmt::format("{:20} {}", l.provider,
                             DNSBL::status_c_str(l.status));
    if (l.return_code)
      std::cout << " " << *l.return_code;
    std::cout << '\n';
  }

  std::cout << '\n';
  for (auto const& line : guide.instructions)
    std::cout << line << '\n';
}
} // namespace

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("domaincheck [--smtp_host=HOST] DOMAIN...");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "domaincheck");
    return 1;
  }

  DNS_ldns::Resolver res{DNS_ldns::configured_timeout()};

  for (int a = 1; a < argc; ++a) {
    do_domain(res, argv[a]);
  }
}
