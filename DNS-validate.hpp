#ifndef DNS_VALIDATE_DOT_HPP
#define DNS_VALIDATE_DOT_HPP

#include "DNS.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Config {
constexpr char dkim_selector_default[] = "default";
constexpr auto record_ttl{3600};
} // namespace Config

namespace DNS {

enum class Record : uint8_t {
  SPF,
  DKIM,
  DMARC,
  MX,
};

constexpr char const* record_c_str(Record record)
{
  switch (record) {
  case Record::SPF: return "SPF";
  case Record::DKIM: return "DKIM";
  case Record::DMARC: return "DMARC";
  case Record::MX: return "MX";
  }
  return "*** unknown Record ***";
}

struct Record_validation {
  std::string domain;
  Record      record;

  bool is_valid{false};
  bool is_present{false}; // found, but maybe malformed

  std::optional<std::string> current_value;
  std::optional<std::string> recommended_value;

  std::vector<std::string> issues;

  std::chrono::system_clock::time_point last_checked;
};

// Relative weight of each record in the overall score, and the share of
// it a present-but-invalid record still earns.
struct Score_weights {
  double spf{30};
  double dkim{25};
  double dmarc{25};
  double mx{20};

  double partial_credit{0.3};

  double of(Record record) const;
};

struct Setup_guide {
  std::string domain;

  Record_validation spf;
  Record_validation dkim;
  Record_validation dmarc;
  Record_validation mx;

  int overall_score{0}; // 0-100

  std::vector<std::string> instructions;
};

Record_validation validate_spf(Resolver&                         res,
                               std::string const&                domain,
                               std::optional<std::string> const& smtp_host
                               = std::nullopt);

Record_validation validate_dkim(Resolver&          res,
                                std::string const& domain,
                                std::string const& selector
                                = Config::dkim_selector_default);

Record_validation validate_dmarc(Resolver& res, std::string const& domain);

Record_validation validate_mx(Resolver& res, std::string const& domain);

// The four lookups run concurrently and are joined before scoring.
Setup_guide validate_domain(Resolver&                         res,
                            std::string const&                domain,
                            std::optional<std::string> const& smtp_host
                            = std::nullopt,
                            std::string const& selector
                            = Config::dkim_selector_default,
                            Score_weights const& weights = Score_weights{});

int overall_score(std::vector<Record_validation> const& validations,
                  Score_weights const&                  weights);

bool spf_record_ok(std::string_view                  record,
                   std::optional<std::string> const& smtp_host);

std::string generate_spf(std::string const&                domain,
                         std::optional<std::string> const& smtp_host);
std::string generate_dkim(std::string_view public_key);
std::string generate_dkim_placeholder();
std::string generate_dmarc(std::string const& domain);

std::vector<std::string> setup_instructions(Setup_guide const& guide,
                                            std::string const& selector
                                            = Config::dkim_selector_default);

// Deliverability warnings attached to an outgoing message; a lookup
// failure yields no warning rather than an error.
std::vector<std::string> sender_warnings(Resolver&          res,
                                         std::string const& domain);

// RFC 6376 section 3.2 tag=value list, as used by DKIM and DMARC.
std::optional<std::map<std::string, std::string>>
parse_tag_list(std::string_view record);

} // namespace DNS

#endif // DNS_VALIDATE_DOT_HPP
