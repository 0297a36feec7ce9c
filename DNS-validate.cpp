#include "DNS-validate.hpp"

#include "Errors.hpp"
#include "iequal.hpp"

#include <algorithm>
#include <cmath>
#include <future>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>

#include <glog/logging.h>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC6376 {

// clang-format off
struct fws       : plus<sor<WSP, one<'\r', '\n'>>> {};

struct tag_name  : seq<ALPHA, star<sor<ALPHA, DIGIT, one<'_'>>>> {};

struct valchar   : sor<range<0x21, 0x3A>, range<0x3C, 0x7E>> {};
struct tval      : plus<valchar> {};
struct tag_value : opt<list<tval, fws>> {};

struct tag_spec  : seq<opt<fws>, tag_name, opt<fws>, one<'='>, opt<fws>,
                       tag_value, opt<fws>> {};

struct tag_list  : seq<list<tag_spec, one<';'>>, opt<one<';'>>, opt<fws>,
                       eof> {};
// clang-format on

struct Ctx {
  std::string                        name;
  std::map<std::string, std::string> tags;
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<tag_name> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    ctx.name = in.string();
  }
};

template <>
struct action<tag_value> {
  template <typename Input>
  static void apply(Input const& in, Ctx& ctx)
  {
    // First occurrence wins; duplicate tags make the record suspect anyway.
    ctx.tags.emplace(ctx.name, in.string());
  }
};

} // namespace RFC6376

namespace {
std::string join(std::vector<std::string> const& strs, std::string_view sep)
{
  std::string ret;
  for (auto const& s : strs) {
    if (!ret.empty())
      ret += sep;
    ret += s;
  }
  return ret;
}

bool contains_ci(std::string_view haystack, std::string_view needle)
{
  return boost::algorithm::icontains(haystack, needle);
}

// The mechanism generate_spf() would emit for this host.
std::string spf_mechanism(std::string const& smtp_host)
{
  if (contains_ci(smtp_host, "gmail") || contains_ci(smtp_host, "google"))
    return "include:_spf.google.com";
  if (contains_ci(smtp_host, "outlook") || contains_ci(smtp_host, "hotmail")
      || contains_ci(smtp_host, "office365"))
    return "include:spf.protection.outlook.com";
  return fmt::format("a:{}", smtp_host);
}

std::string_view unqualified(std::string_view term)
{
  if (!term.empty() && std::string_view("+-~?").find(term.front())
                           != std::string_view::npos)
    term.remove_prefix(1);
  return term;
}

bool is_all_mechanism(std::string_view term)
{
  return iequal(unqualified(term), "all");
}

// An include: or a: mechanism may be how a relay's own record covers
// its servers; the host itself need not appear.
bool is_delegating_mechanism(std::string_view term)
{
  term = unqualified(term);
  return istarts_with(term, "include:") || istarts_with(term, "a:");
}

// Query, converting a thrown DnsLookupError into a bogus answer.
DNS::Answer lookup(DNS::Resolver&     res,
                   DNS::RR_type       type,
                   std::string const& name)
{
  try {
    return res.query(type, name);
  }
  catch (DnsLookupError const& e) {
    DNS::Answer answer;
    answer.bogus_or_indeterminate = true;
    answer.error                  = e.what();
    return answer;
  }
}

DNS::Record_validation
start(std::string const& domain, DNS::Record record)
{
  DNS::Record_validation v;
  v.domain       = domain;
  v.record       = record;
  v.last_checked = std::chrono::system_clock::now();
  return v;
}

bool lookup_failed(DNS::Answer const& answer, DNS::Record_validation& v)
{
  if (answer.bogus_or_indeterminate) {
    v.issues.push_back(fmt::format("DNS lookup failed: {}", answer.error));
    return true;
  }
  return false;
}
} // namespace

namespace DNS {

double Score_weights::of(Record record) const
{
  switch (record) {
  case Record::SPF: return spf;
  case Record::DKIM: return dkim;
  case Record::DMARC: return dmarc;
  case Record::MX: return mx;
  }
  return 0;
}

std::optional<std::map<std::string, std::string>>
parse_tag_list(std::string_view record)
{
  RFC6376::Ctx   ctx;
  memory_input<> in{record.data(), record.size(), "tag-list"};
  try {
    if (!parse<RFC6376::tag_list, RFC6376::action>(in, ctx))
      return {};
  }
  catch (parse_error const& e) {
    LOG(WARNING) << e.what();
    return {};
  }
  return ctx.tags;
}

bool spf_record_ok(std::string_view                  record,
                   std::optional<std::string> const& smtp_host)
{
  std::vector<std::string> terms;
  boost::algorithm::split(terms, record, boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  terms.erase(std::remove(begin(terms), end(terms), std::string{}),
              end(terms));

  if (terms.empty() || !iequal(terms.front(), "v=spf1"))
    return false;

  if (std::none_of(begin(terms), end(terms), is_all_mechanism))
    return false;

  if (smtp_host && !smtp_host->empty()) {
    return contains_ci(record, *smtp_host)
           || std::any_of(begin(terms), end(terms), is_delegating_mechanism);
  }

  return true;
}

std::string generate_spf(std::string const&                domain,
                         std::optional<std::string> const& smtp_host)
{
  if (smtp_host && !smtp_host->empty())
    return fmt::format("v=spf1 {} ~all", spf_mechanism(*smtp_host));
  return fmt::format("v=spf1 a:mail.{} ~all", domain);
}

std::string generate_dkim(std::string_view public_key)
{
  return fmt::format("v=DKIM1; k=rsa; p={}", public_key);
}

std::string generate_dkim_placeholder()
{
  return generate_dkim("<YOUR_DKIM_PUBLIC_KEY>");
}

std::string generate_dmarc(std::string const& domain)
{
  return fmt::format("v=DMARC1; p=quarantine; rua=mailto:dmarc@{0}; "
                     "ruf=mailto:dmarc@{0}; fo=1",
                     domain);
}

Record_validation validate_spf(Resolver&                         res,
                               std::string const&                domain,
                               std::optional<std::string> const& smtp_host)
{
  auto v = start(domain, Record::SPF);

  auto const answer = lookup(res, RR_type::TXT, domain);
  if (!lookup_failed(answer, v)) {
    auto const spfs = txt_containing(answer, "v=spf1");
    if (spfs.empty()) {
      v.issues.push_back("No SPF record found");
    }
    else {
      v.is_present    = true;
      v.current_value = spfs.front();
      if (spfs.size() > 1) {
        // RFC 7208 section 4.5, permerror
        v.issues.push_back("Multiple SPF records found");
      }
      else if (spf_record_ok(spfs.front(), smtp_host)) {
        v.is_valid = true;
      }
      else {
        v.issues.push_back(
            "SPF record exists but may not include your SMTP server");
      }
    }
  }

  if (!v.is_valid)
    v.recommended_value = generate_spf(domain, smtp_host);

  return v;
}

Record_validation validate_dkim(Resolver&          res,
                                std::string const& domain,
                                std::string const& selector)
{
  auto v = start(domain, Record::DKIM);

  auto const name   = fmt::format("{}._domainkey.{}", selector, domain);
  auto const answer = lookup(res, RR_type::TXT, name);
  if (!lookup_failed(answer, v)) {
    auto const dkims = txt_containing(answer, "v=DKIM1");
    if (dkims.empty()) {
      v.issues.push_back(
          fmt::format("No DKIM record found for selector '{}'", selector));
    }
    else {
      v.is_present    = true;
      v.current_value = dkims.front();

      auto const tags = parse_tag_list(dkims.front());
      if (tags && tags->contains("p") && !tags->at("p").empty()) {
        v.is_valid = true;
      }
      else {
        v.issues.push_back("DKIM record missing public key (p= parameter)");
      }
    }
  }

  if (!v.is_valid)
    v.recommended_value = generate_dkim_placeholder();

  return v;
}

Record_validation validate_dmarc(Resolver& res, std::string const& domain)
{
  auto v = start(domain, Record::DMARC);

  auto const answer = lookup(res, RR_type::TXT, fmt::format("_dmarc.{}", domain));
  if (!lookup_failed(answer, v)) {
    auto const dmarcs = txt_containing(answer, "v=DMARC1");
    if (dmarcs.empty()) {
      v.issues.push_back("No DMARC record found");
    }
    else {
      v.is_present    = true;
      v.current_value = dmarcs.front();

      auto const tags = parse_tag_list(dmarcs.front());
      if (tags && tags->contains("p") && !tags->at("p").empty()) {
        v.is_valid = true;
        if (iequal(tags->at("p"), "none")) {
          v.issues.push_back(R"(DMARC policy is set to "none" - consider )"
                             R"(using "quarantine" or "reject")");
        }
      }
      else {
        v.issues.push_back("DMARC record missing policy (p= parameter)");
      }
    }
  }

  if (!v.is_valid)
    v.recommended_value = generate_dmarc(domain);

  return v;
}

Record_validation validate_mx(Resolver& res, std::string const& domain)
{
  auto v = start(domain, Record::MX);

  auto const answer = lookup(res, RR_type::MX, domain);
  if (!lookup_failed(answer, v)) {
    std::vector<RR_MX> mxs;
    for (auto const& rr : answer.rrs) {
      if (std::holds_alternative<RR_MX>(rr))
        mxs.push_back(std::get<RR_MX>(rr));
    }
    std::sort(begin(mxs), end(mxs));

    if (mxs.empty()) {
      v.issues.push_back(
          "No MX records found - this domain cannot receive email");
    }
    else {
      v.is_present = true;

      std::vector<std::string> strs;
      for (auto const& mx : mxs)
        strs.push_back(fmt::format("{} {}", mx.preference(), mx.exchange()));
      v.current_value = join(strs, ", ");

      // RFC 7505 null MX, "0 ."
      if (mxs.size() == 1 && mxs.front().exchange().empty()) {
        v.issues.push_back("Null MX record - this domain does not accept email");
      }
      else {
        v.is_valid = true;
        if (mxs.size() == 1 && mxs.front().preference() != 10) {
          v.issues.push_back(
              "Consider using priority 10 for your primary MX record");
        }
      }
    }
  }

  if (!v.is_valid)
    v.recommended_value = "10 mail.your-provider.com";

  return v;
}

int overall_score(std::vector<Record_validation> const& validations,
                  Score_weights const&                  weights)
{
  auto const total
      = weights.spf + weights.dkim + weights.dmarc + weights.mx;
  if (total <= 0)
    return 0;

  auto earned{0.0};
  for (auto const& v : validations) {
    if (v.is_valid)
      earned += weights.of(v.record);
    else if (v.is_present)
      earned += weights.of(v.record) * weights.partial_credit;
  }

  auto const score = static_cast<int>(std::lround(earned / total * 100));
  return std::clamp(score, 0, 100);
}

Setup_guide validate_domain(Resolver&                         res,
                            std::string const&                domain,
                            std::optional<std::string> const& smtp_host,
                            std::string const&                selector,
                            Score_weights const&              weights)
{
  auto spf = std::async(std::launch::async, [&] {
    return validate_spf(res, domain, smtp_host);
  });
  auto dkim = std::async(std::launch::async, [&] {
    return validate_dkim(res, domain, selector);
  });
  auto dmarc = std::async(std::launch::async,
                          [&] { return validate_dmarc(res, domain); });
  auto mx
      = std::async(std::launch::async, [&] { return validate_mx(res, domain); });

  Setup_guide guide;
  guide.domain = domain;
  guide.spf    = spf.get();
  guide.dkim   = dkim.get();
  guide.dmarc  = dmarc.get();
  guide.mx     = mx.get();

  guide.overall_score = overall_score(
      {guide.spf, guide.dkim, guide.dmarc, guide.mx}, weights);
  guide.instructions = setup_instructions(guide, selector);

  LOG(INFO) << "validated " << domain << ", score " << guide.overall_score;

  return guide;
}

std::vector<std::string> setup_instructions(Setup_guide const& guide,
                                            std::string const& selector)
{
  auto const& domain = guide.domain;

  auto const value = [](Record_validation const& v, std::string fallback) {
    if (v.recommended_value)
      return *v.recommended_value;
    if (v.current_value)
      return *v.current_value;
    return fallback;
  };

  std::vector<std::string> lines{
      "# DNS Configuration Instructions for Email Deliverability",
      "",
      "Add the following DNS records to your domain registrar or DNS provider:",
      "",
  };

  auto const section = [&](std::string_view title, std::string_view type,
                           std::string const& name, std::string const& val) {
    lines.push_back(fmt::format("## {}", title));
    lines.push_back(fmt::format("- **Record Type:** {}", type));
    lines.push_back(fmt::format("- **Name:** {}", name));
    lines.push_back(fmt::format("- **Value:** {}", val));
    lines.push_back(fmt::format("- **TTL:** {}", Config::record_ttl));
  };

  section("SPF Record (Sender Policy Framework)", "TXT", domain,
          value(guide.spf, generate_spf(domain, {})));
  lines.push_back("");

  section("DKIM Record (DomainKeys Identified Mail)", "TXT",
          fmt::format("{}._domainkey.{}", selector, domain),
          value(guide.dkim, generate_dkim_placeholder()));
  lines.push_back("- **Note:** Generate a DKIM key pair and replace the "
                  "placeholder with your public key");
  lines.push_back("");

  section("DMARC Record (Domain-based Message Authentication)", "TXT",
          fmt::format("_dmarc.{}", domain),
          value(guide.dmarc, generate_dmarc(domain)));
  lines.push_back("");

  section("MX Record (Mail Exchange)", "MX", domain,
          value(guide.mx, "10 mail.your-provider.com"));
  lines.push_back("- **Note:** Only required if this domain receives email");
  lines.push_back("");

  lines.push_back("## Additional Recommendations:");
  lines.push_back("1. Use a dedicated static IP address for sending");
  lines.push_back(
      "2. Configure reverse DNS (PTR record) for your sending IP");
  lines.push_back("3. Set up bounce handling and feedback loops");
  lines.push_back("4. Monitor your sender reputation and blacklist status");
  lines.push_back("5. Use TLS encryption for SMTP connections");

  return lines;
}

std::vector<std::string> sender_warnings(Resolver&          res,
                                         std::string const& domain)
{
  std::vector<std::string> warnings;

  auto const spf = lookup(res, RR_type::TXT, domain);
  if (spf.bogus_or_indeterminate) {
    LOG(WARNING) << "SPF lookup for " << domain << " failed: " << spf.error;
  }
  else if (txt_containing(spf, "v=spf1").empty()) {
    warnings.push_back(fmt::format(
        "No SPF record found for domain {}. This may affect deliverability.",
        domain));
  }

  auto const dmarc = lookup(res, RR_type::TXT, fmt::format("_dmarc.{}", domain));
  if (dmarc.bogus_or_indeterminate) {
    LOG(WARNING) << "DMARC lookup for " << domain << " failed: " << dmarc.error;
  }
  else if (txt_containing(dmarc, "v=DMARC1").empty()) {
    warnings.push_back(fmt::format("No DMARC record found for domain {}. "
                                   "Consider adding one for better reputation.",
                                   domain));
  }

  return warnings;
}

} // namespace DNS
