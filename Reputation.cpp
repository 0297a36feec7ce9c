#include "Reputation.hpp"

#include "DNS-validate.hpp"
#include "Message.hpp"

#include <algorithm>
#include <cmath>
#include <future>

#include <glog/logging.h>

#include <fmt/format.h>

namespace Reputation {

namespace {
double percent(long part, long whole)
{
  return whole ? 100.0 * part / whole : 0.0;
}
} // namespace

Delivery_metrics delivery_metrics(std::vector<Store::Email_record> const& recs)
{
  long sent         = 0;
  long delivered    = 0;
  long bounced      = 0;
  long complained   = 0;
  long unsubscribed = 0;

  for (auto const& rec : recs) {
    if (!rec.was_sent())
      continue;
    ++sent;
    if (rec.has_event(Store::Event::DELIVERED))
      ++delivered;
    if (rec.has_event(Store::Event::BOUNCED))
      ++bounced;
    if (rec.has_event(Store::Event::SPAM_REPORT))
      ++complained;
    if (rec.has_event(Store::Event::UNSUBSCRIBE))
      ++unsubscribed;
  }

  Delivery_metrics m;
  m.sent             = sent;
  m.delivery_rate    = percent(delivered, sent);
  m.bounce_rate      = percent(bounced, sent);
  m.complaint_rate   = percent(complained, sent);
  m.unsubscribe_rate = percent(unsubscribed, sent);
  m.spam_rate        = m.complaint_rate;
  return m;
}

Domain_reputation domain_reputation(DNS::Resolver&     res,
                                    std::string const& domain,
                                    std::string const& dkim_selector)
{
  auto guide = std::async(std::launch::async, [&] {
    return DNS::validate_domain(res, domain, std::nullopt, dkim_selector);
  });
  auto listings = std::async(std::launch::async,
                             [&] { return DNSBL::check(res, domain); });

  Domain_reputation dom;
  dom.domain = domain;

  auto const g  = guide.get();
  dom.has_spf   = g.spf.is_valid;
  dom.has_dkim  = g.dkim.is_valid;
  dom.has_dmarc = g.dmarc.is_valid;
  dom.mx_records = g.mx.is_valid ? 1 : 0;

  for (auto const* v : {&g.spf, &g.dkim, &g.dmarc, &g.mx}) {
    for (auto const& issue : v->issues)
      dom.issues.push_back(
          fmt::format("{}: {}", DNS::record_c_str(v->record), issue));
  }

  dom.blacklist_status = listings.get();
  for (auto const& l : dom.blacklist_status) {
    if (l.status == DNSBL::Status::UNKNOWN)
      dom.issues.push_back(
          fmt::format("blacklist {} could not be checked", l.provider));
  }

  dom.trust_score = trust_score(dom);
  return dom;
}

int trust_score(Domain_reputation const& dom)
{
  double score = 0;
  score += dom.has_spf ? 20 : 0;
  score += dom.has_dkim ? 20 : 0;
  score += dom.has_dmarc ? 20 : 0;
  score += dom.mx_records > 0 ? 20 : 0;

  if (auto const total = dom.blacklist_status.size(); total) {
    auto const clean = std::count_if(
        begin(dom.blacklist_status), end(dom.blacklist_status),
        [](auto const& l) { return l.status == DNSBL::Status::CLEAN; });
    score += 20.0 * clean / total;
  }
  return static_cast<int>(std::lround(score));
}

int compliance_score(Domain_reputation const& dom)
{
  return (dom.has_spf ? 25 : 0) + (dom.has_dkim ? 25 : 0)
         + (dom.has_dmarc ? 25 : 0) + (dom.mx_records > 0 ? 25 : 0);
}

int reputation_score(Delivery_metrics const&  delivery,
                     Domain_reputation const& dom,
                     Score_weights const&     weights)
{
  auto const delivery_score = std::max(
      0.0, 100.0 - delivery.bounce_rate * 2 - delivery.complaint_rate * 5);

  auto const score = delivery_score * weights.delivery
                     + dom.trust_score * weights.domain
                     + compliance_score(dom) * weights.compliance;

  return static_cast<int>(std::lround(std::clamp(score, 0.0, 100.0)));
}

std::vector<std::string> recommendations(Delivery_metrics const&  delivery,
                                         Domain_reputation const& dom)
{
  std::vector<std::string> recs;

  if (!dom.has_spf)
    recs.emplace_back(
        "Add SPF record to your domain to improve deliverability");
  if (!dom.has_dkim)
    recs.emplace_back("Configure DKIM signing for email authentication");
  if (!dom.has_dmarc)
    recs.emplace_back("Implement DMARC policy to protect against spoofing");

  if (delivery.bounce_rate > 5)
    recs.emplace_back("High bounce rate detected. Clean your email list and "
                      "validate addresses");
  if (delivery.complaint_rate > 0.1)
    recs.emplace_back(
        "High complaint rate. Review email content and targeting");
  if (delivery.delivery_rate < 95)
    recs.emplace_back("Consider implementing email warmup process for better "
                      "deliverability");

  std::string listed;
  for (auto const& l : dom.blacklist_status) {
    if (l.status != DNSBL::Status::LISTED)
      continue;
    if (!listed.empty())
      listed += ", ";
    listed += l.provider;
  }
  if (!listed.empty())
    recs.push_back(
        fmt::format("Remove your IP from blacklists: {}", listed));

  return recs;
}

std::vector<std::string> warnings(Delivery_metrics const&  delivery,
                                  Domain_reputation const& dom)
{
  std::vector<std::string> warns;

  if (delivery.bounce_rate > 10)
    warns.emplace_back(
        "Critical bounce rate detected - immediate action required");
  if (delivery.complaint_rate > 0.5)
    warns.emplace_back(
        "High spam complaint rate - risk of provider blocking");
  if (DNSBL::any_listed(dom.blacklist_status))
    warns.emplace_back(
        "Domain or IP is blacklisted - emails may not be delivered");

  return warns;
}

std::vector<Warmup_step> warmup_plan()
{
  // clang-format off
  return {
    {1,   50, {"gmail.com", "outlook.com"},
     "Start with major providers, low volume"},
    {3,  100, {"gmail.com", "outlook.com", "yahoo.com"},
     "Increase volume gradually"},
    {7,  250, {"gmail.com", "outlook.com", "yahoo.com", "hotmail.com"},
     "Add more providers, maintain engagement"},
    {14, 500, {"*"},
     "Full volume to all domains"},
  };
  // clang-format on
}

Sending_recommendations sending_recommendations(Metrics const& metrics)
{
  Sending_recommendations recs;

  recs.recommended_volume = static_cast<int>(
      std::lround(Config::base_volume * (metrics.reputation_score / 100.0)));

  if (metrics.reputation_score <= Config::warmup_threshold)
    recs.warmup_plan = warmup_plan();

  if (metrics.delivery.complaint_rate > 0.1) {
    recs.content_optimizations.emplace_back(
        "Review subject lines for spam triggers");
    recs.content_optimizations.emplace_back("Add clear unsubscribe links");
    recs.content_optimizations.emplace_back(
        "Improve content relevance and targeting");
  }
  if (metrics.delivery.bounce_rate > 5) {
    recs.content_optimizations.emplace_back(
        "Implement email validation before sending");
    recs.content_optimizations.emplace_back(
        "Remove invalid addresses from lists");
  }

  // No open/click time series yet, so business hours.
  recs.optimal_sending_times = {
      "09:00-11:00 Tuesday-Thursday",
      "14:00-16:00 Tuesday-Thursday",
      "10:00-12:00 Monday,Friday",
  };

  return recs;
}

Scorer::Scorer(Store::EmailStore& emails,
               DNS::Resolver&     res,
               Score_weights      weights,
               Clock              clock)
  : emails_(emails)
  , res_(res)
  , weights_(weights)
  , clock_(std::move(clock))
{
}

Metrics Scorer::metrics(TenantEmailConfig const& config)
{
  Metrics m;

  auto const since = clock_() - Config::reputation_window;
  m.delivery = delivery_metrics(emails_.created_since(config.tenant_id, since));

  auto const domain = Message::domain_of(config.from_email());
  if (domain.empty()) {
    LOG(WARNING) << "tenant " << config.tenant_id
                 << " has no from domain, domain reputation unknown";
    m.domain.issues.emplace_back("no from address configured");
  }
  else {
    auto selector = std::string{Config::dkim_selector_default};
    if (auto const smtp = config.smtp(); smtp && smtp->dkim_enabled()
                                         && !smtp->dkim->selector.empty())
      selector = smtp->dkim->selector;
    m.domain = domain_reputation(res_, domain, selector);
  }

  m.reputation_score = reputation_score(m.delivery, m.domain, weights_);
  m.recommendations  = recommendations(m.delivery, m.domain);
  m.warnings         = warnings(m.delivery, m.domain);

  LOG(INFO) << "tenant " << config.tenant_id << " reputation "
            << m.reputation_score << " over " << m.delivery.sent << " sent";
  return m;
}

} // namespace Reputation
