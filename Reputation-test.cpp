#include "Reputation.hpp"

#include "DNS-fake.hpp"

#include <algorithm>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
using Reputation::Delivery_metrics;
using Reputation::Domain_reputation;

auto const t0 = std::chrono::system_clock::time_point{} + 100'000'000s;

Store::Email_record sent(int n, std::chrono::system_clock::time_point when = t0)
{
  Store::Email_record rec;
  rec.id        = "email-" + std::to_string(n);
  rec.tenant_id = "t1";
  rec.to        = "reader@example.net";
  rec.status    = Store::Status::SENT;
  rec.created   = when;
  return rec;
}

void add(Store::Email_record& rec, Store::Event event)
{
  rec.events.push_back(Store::Event_record{event, t0, ""});
}

bool has(std::vector<std::string> const& strs, std::string const& str)
{
  return std::find(begin(strs), end(strs), str) != end(strs);
}

Domain_reputation perfect_domain()
{
  Domain_reputation dom;
  dom.domain     = "example.com";
  dom.has_spf    = true;
  dom.has_dkim   = true;
  dom.has_dmarc  = true;
  dom.mx_records = 1;
  for (auto zone : Config::dnsbl_zones) {
    DNSBL::Listing l;
    l.provider = zone;
    l.status   = DNSBL::Status::CLEAN;
    dom.blacklist_status.push_back(l);
  }
  dom.trust_score = Reputation::trust_score(dom);
  return dom;
}

void check_nothing_sent()
{
  auto const m = Reputation::delivery_metrics({});
  CHECK_EQ(m.sent, 0);
  CHECK_EQ(m.delivery_rate, 0.0);
  CHECK_EQ(m.bounce_rate, 0.0);
  CHECK_EQ(m.complaint_rate, 0.0);
  CHECK_EQ(m.unsubscribe_rate, 0.0);
  CHECK_EQ(m.spam_rate, 0.0);

  // Scheduled and failed records were never sent.
  auto scheduled   = sent(1);
  scheduled.status = Store::Status::SCHEDULED;
  auto failed      = sent(2);
  failed.status    = Store::Status::FAILED;
  add(failed, Store::Event::BOUNCED);
  auto const m2 = Reputation::delivery_metrics({scheduled, failed});
  CHECK_EQ(m2.sent, 0);
  CHECK_EQ(m2.bounce_rate, 0.0);
}

// 200 sent, 150 opened, 75 clicked, nothing else.
void check_scenario_c()
{
  std::vector<Store::Email_record> recs;
  for (auto i = 0; i < 200; ++i) {
    auto rec = sent(i);
    if (i < 150)
      add(rec, Store::Event::OPENED);
    if (i < 75)
      add(rec, Store::Event::CLICKED);
    recs.push_back(rec);
  }

  auto const m = Reputation::delivery_metrics(recs);
  CHECK_EQ(m.sent, 200);
  CHECK_EQ(m.bounce_rate, 0.0);
  CHECK_EQ(m.complaint_rate, 0.0);
  CHECK_EQ(m.delivery_rate, 0.0); // opens aren't deliveries

  for (auto i = 0; i < 50; ++i)
    add(recs[i], Store::Event::DELIVERED);
  CHECK_EQ(Reputation::delivery_metrics(recs).delivery_rate, 25.0);
}

void check_rates()
{
  std::vector<Store::Email_record> recs;
  for (auto i = 0; i < 100; ++i) {
    auto rec = sent(i);
    if (i < 90) {
      add(rec, Store::Event::DELIVERED);
      rec.status = Store::Status::DELIVERED;
    }
    else if (i < 98) {
      add(rec, Store::Event::BOUNCED);
      rec.status = Store::Status::BOUNCED;
    }
    if (i == 0)
      add(rec, Store::Event::SPAM_REPORT);
    if (i < 3)
      add(rec, Store::Event::UNSUBSCRIBE);
    recs.push_back(rec);
  }

  auto const m = Reputation::delivery_metrics(recs);
  CHECK_EQ(m.sent, 100);
  CHECK_EQ(m.delivery_rate, 90.0);
  CHECK_EQ(m.bounce_rate, 8.0);
  CHECK_EQ(m.complaint_rate, 1.0);
  CHECK_EQ(m.spam_rate, m.complaint_rate);
  CHECK_EQ(m.unsubscribe_rate, 3.0);

  auto const dom = perfect_domain();
  CHECK_EQ(dom.trust_score, 100);
  // delivery 100 - 16 - 5 = 79
  CHECK_EQ(Reputation::reputation_score(m, dom), 92);

  auto const recs_out = Reputation::recommendations(m, dom);
  CHECK(has(recs_out, "High bounce rate detected. Clean your email list and "
                      "validate addresses"));
  CHECK(has(recs_out, "High complaint rate. Review email content and "
                      "targeting"));
  CHECK(has(recs_out, "Consider implementing email warmup process for "
                      "better deliverability"));
  CHECK_EQ(recs_out.size(), 3u);

  auto const warns = Reputation::warnings(m, dom);
  CHECK_EQ(warns.size(), 1u);
  CHECK_EQ(warns.front(),
           "High spam complaint rate - risk of provider blocking");
}

void check_clamp()
{
  Delivery_metrics all_bounced;
  all_bounced.sent           = 10;
  all_bounced.bounce_rate    = 100.0;
  all_bounced.complaint_rate = 100.0;

  Domain_reputation nothing;
  CHECK_EQ(Reputation::trust_score(nothing), 0);
  CHECK_EQ(Reputation::reputation_score(all_bounced, nothing), 0);

  Delivery_metrics perfect;
  perfect.sent          = 10;
  perfect.delivery_rate = 100.0;
  CHECK_EQ(Reputation::reputation_score(perfect, perfect_domain()), 100);

  Reputation::Score_weights heavy{3.0, 3.0, 3.0};
  CHECK_EQ(Reputation::reputation_score(perfect, perfect_domain(), heavy), 100);

  Reputation::Score_weights negative{-1.0, 0.0, 0.0};
  CHECK_EQ(Reputation::reputation_score(perfect, perfect_domain(), negative),
           0);

  auto const warns = Reputation::warnings(all_bounced, nothing);
  CHECK(has(warns, "Critical bounce rate detected - immediate action required"));
}

void check_blacklisted()
{
  auto dom                      = perfect_domain();
  dom.blacklist_status[0].status = DNSBL::Status::LISTED;
  dom.blacklist_status[2].status = DNSBL::Status::LISTED;
  dom.blacklist_status[3].status = DNSBL::Status::UNKNOWN;
  dom.trust_score                = Reputation::trust_score(dom);
  CHECK_EQ(dom.trust_score, 88); // two of five clean

  Delivery_metrics m;
  m.delivery_rate = 99.0;

  auto const recs = Reputation::recommendations(m, dom);
  CHECK_EQ(recs.size(), 1u);
  CHECK_EQ(recs.front(), "Remove your IP from blacklists: zen.spamhaus.org, "
                         "dnsbl.sorbs.net");
  CHECK(has(Reputation::warnings(m, dom),
            "Domain or IP is blacklisted - emails may not be delivered"));
}

void check_sending_recommendations()
{
  Reputation::Metrics m;
  m.reputation_score = 80;
  auto const low     = Reputation::sending_recommendations(m);
  CHECK_EQ(low.recommended_volume, 800);
  CHECK(low.warmup_plan);
  CHECK_EQ(low.warmup_plan->size(), 4u);
  CHECK_EQ(low.warmup_plan->at(0).day, 1);
  CHECK_EQ(low.warmup_plan->at(0).max_emails, 50);
  CHECK_EQ(low.warmup_plan->at(1).target_domains.size(), 3u);
  CHECK_EQ(low.warmup_plan->at(2).max_emails, 250);
  CHECK_EQ(low.warmup_plan->at(3).day, 14);
  CHECK_EQ(low.warmup_plan->at(3).target_domains.front(), "*");
  CHECK(low.content_optimizations.empty());
  CHECK_EQ(low.optimal_sending_times.size(), 3u);

  m.reputation_score          = 81;
  m.delivery.bounce_rate      = 6.0;
  m.delivery.complaint_rate   = 0.2;
  auto const high             = Reputation::sending_recommendations(m);
  CHECK_EQ(high.recommended_volume, 810);
  CHECK(!high.warmup_plan);
  CHECK_EQ(high.content_optimizations.size(), 5u);
}

void check_scorer()
{
  DNS::Fake_resolver res;
  res.add_txt("example.com", "v=spf1 mx ~all");
  res.add_txt("_dmarc.example.com", "v=DMARC1; p=reject");
  res.add_txt("s1._domainkey.example.com", "v=DKIM1; k=rsa; p=MIIBIjAN");
  res.add_mx("example.com", "mx.example.com", 10);
  res.add_a("example.com", "192.0.2.1");

  Store::MemoryEmailStore emails;
  for (auto i = 0; i < 10; ++i) {
    auto rec = sent(i);
    add(rec, Store::Event::DELIVERED);
    emails.put(rec);
  }
  auto old = sent(99, t0 - 31 * 24h);
  add(old, Store::Event::BOUNCED);
  emails.put(old);

  auto other      = sent(100);
  other.tenant_id = "t2";
  add(other, Store::Event::BOUNCED);
  emails.put(other);

  Reputation::Scorer scorer{emails, res, Reputation::Score_weights{},
                            [] { return t0 + 1h; }};

  SmtpConfig smtp;
  smtp.from_email = "news@example.com";
  smtp.dkim       = DkimConfig{true, "pem", "s1", "example.com"};

  TenantEmailConfig config;
  config.tenant_id       = "t1";
  config.provider_config = smtp;

  auto const m = scorer.metrics(config);
  CHECK_EQ(m.delivery.sent, 10);
  CHECK_EQ(m.delivery.delivery_rate, 100.0);
  CHECK_EQ(m.delivery.bounce_rate, 0.0);

  CHECK_EQ(m.domain.domain, "example.com");
  CHECK(m.domain.has_spf);
  CHECK(m.domain.has_dkim);
  CHECK(m.domain.has_dmarc);
  CHECK_EQ(m.domain.mx_records, 1);
  CHECK_EQ(m.domain.blacklist_status.size(), 5u);
  CHECK_EQ(m.domain.trust_score, 100);
  CHECK_EQ(m.reputation_score, 100);
  CHECK(m.recommendations.empty());
  CHECK(m.warnings.empty());

  // No from address, nothing to look up.
  TenantEmailConfig bare;
  bare.tenant_id       = "t1";
  bare.provider_config = SendGridConfig{};
  auto const b         = scorer.metrics(bare);
  CHECK_EQ(b.domain.domain, "unknown");
  CHECK_EQ(b.domain.trust_score, 0);
  CHECK(!b.domain.issues.empty());
  CHECK_EQ(b.reputation_score, 40);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_nothing_sent();
  check_scenario_c();
  check_rates();
  check_clamp();
  check_blacklisted();
  check_sending_recommendations();
  check_scorer();
}
