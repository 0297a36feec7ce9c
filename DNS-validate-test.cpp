#include "DNS-validate.hpp"

#include "DNS-fake.hpp"

#include <algorithm>

#include <glog/logging.h>

using DNS::Fake_resolver;

namespace {
bool has_line(std::vector<std::string> const& lines, std::string const& line)
{
  return std::find(begin(lines), end(lines), line) != end(lines);
}

void check_tag_list()
{
  auto const tags = DNS::parse_tag_list("v=DKIM1; k=rsa; p=MIGfMA0G");
  CHECK(tags);
  CHECK_EQ(tags->at("v"), "DKIM1");
  CHECK_EQ(tags->at("k"), "rsa");
  CHECK_EQ(tags->at("p"), "MIGfMA0G");

  auto const trailing = DNS::parse_tag_list("v=DMARC1;p=reject;");
  CHECK(trailing);
  CHECK_EQ(trailing->at("p"), "reject");

  auto const empty_p = DNS::parse_tag_list("v=DKIM1; p=");
  CHECK(empty_p);
  CHECK(empty_p->at("p").empty());

  CHECK(!DNS::parse_tag_list("this is not a tag list"));
  CHECK(!DNS::parse_tag_list("=value"));
}

void check_spf_property()
{
  char const* const records[]{
      "v=spf1 ~all",
      "v=spf1 mx ~all",
      "v=spf1 include:_spf.google.com ~all",
      "v=spf1 a:mail.example.com ip4:192.0.2.0/24 ~all",
  };
  for (auto record : records) {
    std::string rec{record};
    CHECK(DNS::spf_record_ok(rec, std::nullopt)) << rec;

    Fake_resolver res;
    res.add_txt("example.com", rec);
    CHECK(DNS::validate_spf(res, "example.com").is_valid) << rec;

    auto const no_all = rec.substr(0, rec.rfind(" ~all"));
    CHECK(!DNS::spf_record_ok(no_all, std::nullopt)) << no_all;

    Fake_resolver res2;
    res2.add_txt("example.com", no_all);
    auto const v = DNS::validate_spf(res2, "example.com");
    CHECK(!v.is_valid) << no_all;
    CHECK(v.is_present);
  }

  CHECK(DNS::spf_record_ok("v=spf1 -all", std::nullopt));
  CHECK(DNS::spf_record_ok("v=spf1 ?all", std::nullopt));
  CHECK(!DNS::spf_record_ok("v=spf2 ~all", std::nullopt));
  CHECK(!DNS::spf_record_ok("v=spf1 include:allmail.example ~al", std::nullopt));

  // The sending host has to be authorized.
  CHECK(DNS::spf_record_ok("v=spf1 include:_spf.google.com ~all",
                           "smtp.gmail.com"));
  CHECK(DNS::spf_record_ok("v=spf1 a:mail.example.net ~all",
                           "mail.example.net"));
  CHECK(!DNS::spf_record_ok("v=spf1 mx ~all", "mail.example.net"));

  // Relays publish their own record to include.
  CHECK(DNS::spf_record_ok("v=spf1 include:sendgrid.net ~all",
                           std::string{"smtp.sendgrid.net"}));
  CHECK(DNS::spf_record_ok("v=spf1 include:amazonses.com ~all",
                           std::string{"email-smtp.us-east-1.amazonaws.com"}));
  CHECK(DNS::spf_record_ok("v=spf1 mx +include:mailgun.org -all",
                           std::string{"smtp.mailgun.org"}));
  CHECK(DNS::spf_record_ok("v=spf1 A:out.example.org ~all",
                           std::string{"smtp.mailgun.org"}));
  CHECK(!DNS::spf_record_ok("v=spf1 a mx ip4:192.0.2.1 ~all",
                            std::string{"smtp.mailgun.org"}));
  CHECK(!DNS::spf_record_ok("v=spf1 include:sendgrid.net",
                            std::string{"smtp.sendgrid.net"}));

  Fake_resolver res;
  res.add_txt("example.com", "v=spf1 mx ~all");
  auto const v = DNS::validate_spf(res, "example.com", "smtp.office365.com");
  CHECK(!v.is_valid);
  CHECK_EQ(v.recommended_value.value(),
           "v=spf1 include:spf.protection.outlook.com ~all");
}

// No records at all.
void check_scenario_a()
{
  Fake_resolver res;
  auto const guide = DNS::validate_domain(res, "bare.example", std::nullopt);

  CHECK_EQ(guide.overall_score, 0);
  for (auto const* v : {&guide.spf, &guide.dkim, &guide.dmarc, &guide.mx}) {
    CHECK(!v->is_valid);
    CHECK(!v->is_present);
    CHECK_EQ(v->issues.size(), 1u);
    CHECK(v->recommended_value);
  }
  CHECK_EQ(guide.spf.recommended_value.value(),
           "v=spf1 a:mail.bare.example ~all");
  CHECK_EQ(guide.dkim.recommended_value.value(),
           "v=DKIM1; k=rsa; p=<YOUR_DKIM_PUBLIC_KEY>");
  CHECK_EQ(guide.dmarc.recommended_value.value(),
           "v=DMARC1; p=quarantine; rua=mailto:dmarc@bare.example; "
           "ruf=mailto:dmarc@bare.example; fo=1");
  CHECK_EQ(guide.mx.recommended_value.value(), "10 mail.your-provider.com");

  CHECK(has_line(guide.instructions, "- **Name:** _dmarc.bare.example"));
  CHECK(has_line(guide.instructions,
                 "- **Name:** default._domainkey.bare.example"));
  CHECK(has_line(guide.instructions, "- **TTL:** 3600"));
  CHECK(has_line(guide.instructions,
                 "5. Use TLS encryption for SMTP connections"));
}

// Valid SPF and MX, no DKIM or DMARC.
void check_scenario_b()
{
  Fake_resolver res;
  res.add_txt("half.example", "v=spf1 mx ~all");
  res.add_txt("half.example", "google-site-verification=abc");
  res.add_mx("half.example", "mx1.half.example", 10);

  auto const guide = DNS::validate_domain(res, "half.example", std::nullopt);
  CHECK(guide.spf.is_valid);
  CHECK(guide.mx.is_valid);
  CHECK(guide.mx.issues.empty());
  CHECK(!guide.dkim.is_valid);
  CHECK(!guide.dmarc.is_valid);
  CHECK_EQ(guide.overall_score, 50);
  CHECK_EQ(guide.spf.current_value.value(), "v=spf1 mx ~all");
  CHECK(!guide.spf.recommended_value);
}

void check_partial_credit()
{
  Fake_resolver res;
  res.add_txt("partial.example", "v=spf1 mx");                // no all
  res.add_txt("s1._domainkey.partial.example", "v=DKIM1; p="); // revoked
  res.add_txt("_dmarc.partial.example", "v=DMARC1; p=none");
  res.add_mx("partial.example", "mx.partial.example", 5);

  auto const guide
      = DNS::validate_domain(res, "partial.example", std::nullopt, "s1");

  CHECK(guide.spf.is_present && !guide.spf.is_valid);
  CHECK(guide.dkim.is_present && !guide.dkim.is_valid);
  CHECK(guide.dmarc.is_valid);
  CHECK_EQ(guide.dmarc.issues.size(), 1u); // p=none advisory
  CHECK(guide.mx.is_valid);
  CHECK_EQ(guide.mx.issues.size(), 1u); // not priority 10

  // 30 * 0.3 + 25 * 0.3 + 25 + 20
  CHECK_EQ(guide.overall_score, 62);

  DNS::Score_weights mx_only;
  mx_only.spf   = 0;
  mx_only.dkim  = 0;
  mx_only.dmarc = 0;
  CHECK_EQ(DNS::overall_score({guide.spf, guide.dkim, guide.dmarc, guide.mx},
                              mx_only),
           100);
}

void check_lookup_failures()
{
  Fake_resolver res;
  res.fail(DNS::RR_type::TXT, "broken.example");
  res.unreachable("_dmarc.broken.example");
  res.add_mx("broken.example", "", 0); // null MX

  auto const guide = DNS::validate_domain(res, "broken.example", std::nullopt);
  CHECK(!guide.spf.is_present);
  CHECK_EQ(guide.spf.issues.front(), "DNS lookup failed: server failure");
  CHECK(!guide.dmarc.is_present);
  CHECK_EQ(guide.dmarc.issues.size(), 1u);
  CHECK(guide.mx.is_present);
  CHECK(!guide.mx.is_valid);
  CHECK_EQ(guide.overall_score, 6); // 20 * 0.3

  Fake_resolver twice;
  twice.add_txt("two.example", "v=spf1 a ~all");
  twice.add_txt("two.example", "v=spf1 mx ~all");
  auto const two = DNS::validate_spf(twice, "two.example");
  CHECK(two.is_present);
  CHECK(!two.is_valid);
}

void check_sender_warnings()
{
  Fake_resolver res;
  res.add_txt("warn.example", "v=spf1 mx ~all");

  auto const warnings = DNS::sender_warnings(res, "warn.example");
  CHECK_EQ(warnings.size(), 1u);
  CHECK_EQ(warnings.front().find("No DMARC record found for domain "
                                 "warn.example"),
           0u);

  Fake_resolver down;
  down.unreachable("down.example");
  down.unreachable("_dmarc.down.example");
  CHECK(DNS::sender_warnings(down, "down.example").empty());
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_tag_list();
  check_spf_property();
  check_scenario_a();
  check_scenario_b();
  check_partial_credit();
  check_lookup_failures();
  check_sender_warnings();

  CHECK_EQ(DNS::generate_spf("example.com", "smtp.gmail.com"),
           "v=spf1 include:_spf.google.com ~all");
  CHECK_EQ(DNS::generate_dkim("MIIB"), "v=DKIM1; k=rsa; p=MIIB");
}
