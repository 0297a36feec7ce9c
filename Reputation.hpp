#ifndef REPUTATION_DOT_HPP
#define REPUTATION_DOT_HPP

#include "DNS.hpp"
#include "DNSBL.hpp"
#include "Store.hpp"
#include "TenantConfig.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Config {
constexpr auto reputation_window = std::chrono::hours(24 * 30);

constexpr int base_volume{1000};
constexpr int warmup_threshold{80}; // warm up at or below this score
} // namespace Config

namespace Reputation {

// Percentages, 0 to 100, of the records sent in the window.
struct Delivery_metrics {
  long sent{0};

  double delivery_rate{0.0};
  double bounce_rate{0.0};
  double complaint_rate{0.0};
  double unsubscribe_rate{0.0};
  double spam_rate{0.0}; // same as complaint_rate
};

struct Domain_reputation {
  std::string domain{"unknown"};

  bool has_spf{false};
  bool has_dkim{false};
  bool has_dmarc{false};
  int  mx_records{0};

  std::vector<DNSBL::Listing> blacklist_status;

  int trust_score{0}; // 0 to 100

  // Why a lookup said less than it could have.
  std::vector<std::string> issues;
};

struct Score_weights {
  double delivery{0.4};
  double domain{0.3};
  double compliance{0.3};
};

struct Metrics {
  Delivery_metrics  delivery;
  Domain_reputation domain;

  int reputation_score{0}; // 0 to 100

  std::vector<std::string> recommendations;
  std::vector<std::string> warnings;
};

struct Warmup_step {
  int                      day;
  int                      max_emails;
  std::vector<std::string> target_domains;
  std::string              description;
};

struct Sending_recommendations {
  int recommended_volume{0};

  std::optional<std::vector<Warmup_step>> warmup_plan;

  std::vector<std::string> content_optimizations;
  std::vector<std::string> optimal_sending_times;
};

Delivery_metrics delivery_metrics(std::vector<Store::Email_record> const& recs);

// DNS records and blacklists for one sending domain, all lookups
// concurrent.  Failures land in issues.
Domain_reputation domain_reputation(DNS::Resolver&     res,
                                    std::string const& domain,
                                    std::string const& dkim_selector);

// 20 for each of SPF, DKIM, DMARC and MX plus 20 times the clean share
// of blacklists.
int trust_score(Domain_reputation const& dom);

// 25 for each of SPF, DKIM, DMARC and MX.
int compliance_score(Domain_reputation const& dom);

int reputation_score(Delivery_metrics const&  delivery,
                     Domain_reputation const& dom,
                     Score_weights const&     weights = Score_weights{});

std::vector<std::string> recommendations(Delivery_metrics const&  delivery,
                                         Domain_reputation const& dom);
std::vector<std::string> warnings(Delivery_metrics const&  delivery,
                                  Domain_reputation const& dom);

std::vector<Warmup_step> warmup_plan();

Sending_recommendations sending_recommendations(Metrics const& metrics);

using Clock = std::function<std::chrono::system_clock::time_point()>;

class Scorer {
public:
  Scorer(Store::EmailStore& emails,
         DNS::Resolver&     res,
         Score_weights      weights = Score_weights{},
         Clock              clock   = std::chrono::system_clock::now);

  Metrics metrics(TenantEmailConfig const& config);

private:
  Store::EmailStore& emails_;
  DNS::Resolver&     res_;
  Score_weights      weights_;
  Clock              clock_;
};

} // namespace Reputation

#endif // REPUTATION_DOT_HPP
