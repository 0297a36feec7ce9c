// send one message through the configured SMTP relay

#include "DNS-ldns.hpp"
#include "Errors.hpp"
#include "Orchestrator.hpp"
#include "Pill.hpp"

#include <iostream>

#include <gflags/gflags.h>

DEFINE_string(to, "", "recipient address");
DEFINE_string(subject, "", "subject");
DEFINE_string(content, "", "HTML body");
DEFINE_string(text, "", "plain text body, default is made from the HTML");
DEFINE_string(campaign, "", "campaign id for X-Campaign-ID");

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage(
      "deliver --smtp_host=HOST --smtp_user=USER --smtp_pass=PASS "
      "--to=ADDR --subject=TEXT --content=HTML");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto const relay = Router::relay_config();
  if (!relay) {
    LOG(ERROR) << "no SMTP relay configured, see --smtp_host, --smtp_user "
                  "and --smtp_pass";
    return 1;
  }

  DNS_ldns::Resolver         res{DNS_ldns::configured_timeout()};
  Store::MemoryConfigStore   configs;
  Store::MemoryEmailStore    emails;
  SendGrid::CurlClient       api;
  Transport::Pool            pool{std::make_unique<Transport::SmtpSessionFactory>()};
  Router::Chain              router{pool, api, res, relay};
  Reputation::Scorer         scorer{emails, res};
  Orchestrator::Engine       engine{configs, emails, pool, router, scorer, res};

  TenantEmailConfig config;
  config.tenant_id       = "deliver";
  config.provider_config = *relay;

  Outbound msg;
  msg.to             = FLAGS_to;
  msg.subject        = FLAGS_subject;
  msg.content        = FLAGS_content;
  msg.correlation_id = std::string{Pill{}.as_string_view()};
  if (!FLAGS_text.empty())
    msg.text = FLAGS_text;
  if (!FLAGS_campaign.empty())
    msg.campaign_id = FLAGS_campaign;

  try {
    engine.configure(config);
    auto const result = engine.send(config.tenant_id, msg);
    engine.shutdown();

    for (auto const& warning : result.warnings)
      std::cout << "warning: " << warning << '\n';

    if (!result.success) {
      std::cout << "failed: " << result.error.value_or("unknown error")
                << '\n';
      return 1;
    }
    std::cout << "sent " << result.message_id.value_or("") << " in "
              << result.delivery_time.count() << " ms\n";
  }
  catch (ConfigurationError const& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
  catch (ValidationError const& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
