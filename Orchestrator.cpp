#include "Orchestrator.hpp"

#include "DKIM-keygen.hpp"
#include "Errors.hpp"
#include "Mailbox.hpp"
#include "Message.hpp"
#include "Now.hpp"
#include "Pill.hpp"

#include <glog/logging.h>

#include <fmt/format.h>

namespace Config {
constexpr int dns_score_advisory{80};
} // namespace Config

namespace Orchestrator {

Engine::Engine(Store::ConfigStore& configs,
               Store::EmailStore&  emails,
               Transport::Pool&    pool,
               Router::Chain&      router,
               Reputation::Scorer& scorer,
               DNS::Resolver&      res)
  : configs_(configs)
  , emails_(emails)
  , pool_(pool)
  , router_(router)
  , scorer_(scorer)
  , res_(res)
{
}

TenantEmailConfig Engine::configure(TenantEmailConfig const& config)
{
  validate(config);
  configs_.put(config);
  LOG(INFO) << "tenant " << config.tenant_id << " configured for "
            << provider_c_str(config.provider());
  return config;
}

std::optional<TenantEmailConfig> Engine::config(std::string const& tenant_id)
{
  return configs_.get(tenant_id);
}

TenantEmailConfig Engine::config_(std::string const& tenant_id)
{
  auto config = configs_.get(tenant_id);
  if (!config)
    throw ConfigurationError(
        fmt::format("No email settings found for tenant {}", tenant_id));
  return *config;
}

DeliveryResult Engine::failed_(TenantEmailConfig const& config,
                               Outbound const&          msg,
                               std::string const&       error)
{
  LOG(WARNING) << "delivery failed for tenant " << config.tenant_id
               << " provider " << provider_c_str(config.provider())
               << " correlation id " << msg.correlation_id << ": " << error;
  if (!emails_.mark_failed(msg.correlation_id, error)) {
    LOG(INFO) << "no email record " << msg.correlation_id << " to mark failed";
  }

  auto result{DeliveryResult{}};
  result.error         = error;
  result.provider_used = config.provider();
  return result;
}

DeliveryResult Engine::send(std::string const& tenant_id, Outbound const& msg)
{
  std::string err;
  if (!Mailbox::validate(msg.to, err)) {
    auto const what = fmt::format("invalid recipient «{}»: {}", msg.to, err);
    LOG(WARNING) << "tenant " << tenant_id << " correlation id "
                 << msg.correlation_id << ": " << what;
    if (!emails_.mark_failed(msg.correlation_id, what)) {
      LOG(INFO) << "no email record " << msg.correlation_id;
    }
    throw ValidationError(what);
  }

  std::optional<TenantEmailConfig> config;
  try {
    config = config_(tenant_id);

    auto result = router_.send(*config, msg);
    if (!result.success) {
      LOG(WARNING) << "delivery failed for tenant " << tenant_id
                   << " provider "
                   << provider_c_str(
                          result.provider_used.value_or(config->provider()))
                   << " correlation id " << msg.correlation_id << ": "
                   << result.error.value_or("unknown error");
      if (!emails_.mark_failed(msg.correlation_id,
                               result.error.value_or("unknown error"))) {
        LOG(INFO) << "no email record " << msg.correlation_id;
      }
      return result;
    }

    if (!emails_.mark_sent(msg.correlation_id, result)) {
      LOG(INFO) << "no email record " << msg.correlation_id << " to mark sent";
    }
    for (auto const& warning : result.warnings)
      LOG(INFO) << "tenant " << tenant_id << ": " << warning;
    return result;
  }
  catch (RateLimitError const& e) {
    auto result        = failed_(*config, msg, e.what());
    result.retry_after = e.wait();
    return result;
  }
  catch (NoProviderAvailable const& e) {
    return failed_(*config, msg, e.what());
  }
  catch (TransportError const& e) {
    return failed_(*config, msg, e.what());
  }
  catch (SendError const& e) {
    return failed_(*config, msg, e.what());
  }
  catch (ConfigurationError const& e) {
    LOG(WARNING) << "tenant " << tenant_id << " correlation id "
                 << msg.correlation_id << ": " << e.what();
    if (!emails_.mark_failed(msg.correlation_id, e.what())) {
      LOG(INFO) << "no email record " << msg.correlation_id;
    }
    throw;
  }
}

DNS::Setup_guide
Engine::validate_domain(std::string const&                domain,
                        std::optional<std::string> const& smtp_host)
{
  return DNS::validate_domain(res_, domain, smtp_host);
}

Reputation::Metrics Engine::reputation(std::string const& tenant_id)
{
  return scorer_.metrics(config_(tenant_id));
}

Reputation::Sending_recommendations
Engine::sending_recommendations(std::string const& tenant_id)
{
  return Reputation::sending_recommendations(reputation(tenant_id));
}

std::vector<DNSBL::Listing> Engine::check_blacklist(std::string const& domain)
{
  return DNSBL::check(res_, domain);
}

Dkim_setup Engine::generate_dkim_key_pair(std::string const& tenant_id)
{
  auto config = config_(tenant_id);

  auto const domain = Message::domain_of(config.from_email());
  if (domain.empty())
    throw ConfigurationError(fmt::format(
        "tenant {} has no from email domain to sign for", tenant_id));

  auto const pair = DKIM::generate_key_pair(domain);

  if (auto const smtp = config.smtp(); smtp != nullptr) {
    smtp->dkim = DkimConfig{true, pair.private_key, pair.selector, domain};
    configs_.put(config);
    LOG(INFO) << "tenant " << tenant_id << " now signs as " << pair.dns_name;
  }

  Dkim_setup setup;
  setup.private_key = pair.private_key;
  setup.public_key  = pair.public_key;
  setup.selector    = pair.selector;
  setup.dns_record  = Dns_record{pair.dns_name, "TXT", pair.dns_value};
  return setup;
}

Setup_check Engine::validate_email_setup(std::string const& tenant_id)
{
  Setup_check check;
  check.last_checked = std::chrono::system_clock::now();

  auto const config = configs_.get(tenant_id);
  if (!config) {
    check.issues.emplace_back("No email configuration found");
    check.recommendations.emplace_back(
        "Configure an email provider (SendGrid or SMTP)");
    return check;
  }

  check.provider = config->provider();

  if (auto const sg = config->sendgrid(); sg != nullptr) {
    if (!has_usable_api_key(*sg)) {
      check.issues.emplace_back(
          "SendGrid API key is missing or using placeholder value");
      check.recommendations.emplace_back("Add a valid SendGrid API key");
    }
    if (sg->from_email.empty()) {
      check.issues.emplace_back("SendGrid from email is not configured");
      check.recommendations.emplace_back("Configure a from email address");
    }
  }

  if (auto const smtp = config->smtp(); smtp != nullptr) {
    if (smtp->host.empty() || smtp->username.empty()
        || smtp->password.empty()) {
      check.issues.emplace_back("SMTP configuration is incomplete");
      check.recommendations.emplace_back(
          "Complete SMTP host, username, and password configuration");
    }
    if (smtp->from_email.empty()) {
      check.issues.emplace_back("SMTP from email is not configured");
      check.recommendations.emplace_back("Configure a from email address");
    }
    else {
      auto selector = std::string{Config::dkim_selector_default};
      if (smtp->dkim_enabled() && !smtp->dkim->selector.empty())
        selector = smtp->dkim->selector;

      auto const guide
          = DNS::validate_domain(res_, Message::domain_of(smtp->from_email),
                                 smtp->host, selector);
      if (guide.overall_score < Config::dns_score_advisory) {
        check.issues.push_back(fmt::format(
            "DNS configuration score is {}% - may affect deliverability",
            guide.overall_score));
        check.recommendations.emplace_back(
            "Improve DNS configuration (SPF, DKIM, DMARC records)");
      }
      check.dns_validation = guide;
    }
  }

  check.is_valid = check.issues.empty();
  return check;
}

DeliveryResult Engine::test_configuration(std::string const& tenant_id,
                                          std::string const& test_email)
{
  auto const config = config_(tenant_id);

  Now const now;

  Outbound msg;
  msg.to      = test_email;
  msg.subject = "Email Configuration Test";
  msg.content = fmt::format(
      "<h2>Email Configuration Test</h2>\n"
      "<p>This is a test email to verify your email configuration.</p>\n"
      "<p><strong>Provider:</strong> {}</p>\n"
      "<p><strong>Timestamp:</strong> {}</p>\n"
      "<p>If you received this email, your configuration is working "
      "correctly!</p>\n",
      provider_c_str(config.provider()), now.c_str());
  msg.correlation_id = fmt::format("config-test.{}", Pill{}.as_string_view());

  return send(tenant_id, msg);
}

bool Engine::track_event(std::string const& tenant_id,
                         std::string const& email_id,
                         Store::Event       event,
                         std::string        data)
{
  auto const rec = emails_.get(email_id);
  if (!rec || rec->tenant_id != tenant_id) {
    LOG(WARNING) << "tenant " << tenant_id << " has no email " << email_id
                 << " for event " << Store::event_c_str(event);
    return false;
  }

  LOG(INFO) << "email " << email_id << " " << Store::event_c_str(event);
  return emails_.add_event(
      email_id,
      Store::Event_record{event, std::chrono::system_clock::now(),
                          std::move(data)});
}

std::vector<Transport::Stats> Engine::connection_stats() const
{
  return pool_.stats();
}

void Engine::shutdown() { pool_.shutdown(); }

} // namespace Orchestrator
