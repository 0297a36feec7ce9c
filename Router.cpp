#include "Router.hpp"

#include "DNS-validate.hpp"
#include "Errors.hpp"
#include "Message.hpp"
#include "osutil.hpp"

#include <cstdlib>
#include <exception>

#include <gflags/gflags.h>

DEFINE_string(smtp_host, "", "fallback SMTP relay host");
DEFINE_int32(smtp_port, 587, "fallback SMTP relay port");
DEFINE_bool(smtp_secure, false, "TLS on connect to the SMTP relay");
DEFINE_string(smtp_user, "", "SMTP relay user name");
DEFINE_string(smtp_pass, "", "SMTP relay password");
DEFINE_string(smtp_from, "", "From address for the relay, default is the user");
DEFINE_string(smtp_from_name, "", "From display name for the relay");

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
constexpr char no_provider[]
    = "Neither SendGrid nor SMTP is properly configured.";

std::string flag_or_env(std::string const& flag, char const* env)
{
  if (!flag.empty())
    return flag;
  auto const val = getenv(env);
  return val ? val : "";
}

bool is_default(char const* flag)
{
  return gflags::GetCommandLineFlagInfoOrDie(flag).is_default;
}
} // namespace

namespace Router {

std::optional<SmtpConfig> relay_config()
{
  SmtpConfig relay;
  relay.host     = flag_or_env(FLAGS_smtp_host, "DELIVERD_SMTP_HOST");
  relay.username = flag_or_env(FLAGS_smtp_user, "DELIVERD_SMTP_USER");
  relay.password = flag_or_env(FLAGS_smtp_pass, "DELIVERD_SMTP_PASS");

  if (relay.host.empty() || relay.username.empty()
      || relay.password.empty()) {
    LOG(INFO) << "SMTP relay configuration is incomplete, no SMTP fallback";
    return {};
  }

  relay.port   = static_cast<uint16_t>(FLAGS_smtp_port);
  relay.secure = FLAGS_smtp_secure;
  if (is_default("smtp_port")) {
    if (auto const env = getenv("DELIVERD_SMTP_PORT"); env != nullptr)
      relay.port = osutil::get_port(env, "tcp");
  }
  if (is_default("smtp_secure")) {
    if (auto const env = getenv("DELIVERD_SMTP_SECURE"); env != nullptr)
      relay.secure = std::string_view{env} == "true"
                     || std::string_view{env} == "1";
  }

  relay.from_email = flag_or_env(FLAGS_smtp_from, "DELIVERD_SMTP_FROM");
  if (relay.from_email.empty())
    relay.from_email = relay.username;
  relay.from_name = flag_or_env(FLAGS_smtp_from_name, "DELIVERD_SMTP_FROM_NAME");

  LOG(INFO) << "SMTP relay is " << relay.host << ":" << relay.port;
  return relay;
}

Chain::Chain(Transport::Pool&          pool,
             SendGrid::Client&         api,
             DNS::Resolver&            res,
             std::optional<SmtpConfig> relay)
  : pool_(pool)
  , api_(api)
  , res_(res)
  , relay_(std::move(relay))
{
}

DeliveryResult Chain::send_smtp_(SmtpConfig const& config, Outbound const& msg)
{
  auto result = pool_.send(config, msg);
  if (result.success) {
    auto const warnings
        = DNS::sender_warnings(res_, Message::domain_of(config.from_email));
    result.warnings.insert(end(result.warnings), begin(warnings),
                           end(warnings));
  }
  return result;
}

DeliveryResult Chain::send(TenantEmailConfig const& config, Outbound const& msg)
{
  if (auto const smtp = config.smtp(); smtp != nullptr) {
    LOG(INFO) << "tenant " << config.tenant_id << " sends via SMTP "
              << smtp->key();
    return send_smtp_(*smtp, msg);
  }

  auto const sg = config.sendgrid();
  CHECK_NOTNULL(sg);

  std::optional<std::string> api_error;
  if (has_usable_api_key(*sg)) {
    auto const start = std::chrono::steady_clock::now();
    try {
      LOG(INFO) << "sending to " << msg.to << " via SendGrid";
      auto const id = api_.send(*sg, msg);

      auto result{DeliveryResult{}};
      result.success       = true;
      result.provider_used = Provider::SENDGRID;
      if (!id.empty())
        result.message_id = id;
      result.delivery_time
          = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - start);
      return result;
    }
    catch (SendError const& e) {
      LOG(WARNING) << "SendGrid failed, falling back to SMTP: " << e.what();
      api_error = e.what();
    }
    catch (std::exception const& e) {
      LOG(ERROR) << "SendGrid client error, falling back to SMTP: "
                 << e.what();
      api_error = e.what();
    }
  }
  else {
    LOG(INFO) << "SendGrid API key not configured, using SMTP fallback";
  }

  if (!relay_ || !pool_.is_available(*relay_))
    throw NoProviderAvailable(no_provider);

  auto result = send_smtp_(*relay_, msg);
  if (api_error)
    result.warnings.insert(begin(result.warnings),
                           fmt::format("SendGrid failed: {}", *api_error));
  return result;
}

std::optional<Provider> Chain::preferred(TenantEmailConfig const& config)
{
  if (config.smtp())
    return Provider::SMTP;
  if (has_usable_api_key(*config.sendgrid()))
    return Provider::SENDGRID;
  if (relay_ && pool_.is_available(*relay_))
    return Provider::SMTP;
  return {};
}

} // namespace Router
