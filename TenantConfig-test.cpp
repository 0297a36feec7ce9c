#include "TenantConfig.hpp"

#include "Errors.hpp"

#include <string>

#include <glog/logging.h>

namespace {
std::string config_error(TenantEmailConfig const& config)
{
  try {
    validate(config);
  }
  catch (ConfigurationError const& e) {
    return e.what();
  }
  return "";
}

SmtpConfig good_smtp()
{
  SmtpConfig smtp;
  smtp.host       = "smtp.example.com";
  smtp.port       = 587;
  smtp.username   = "mailer";
  smtp.password   = "hunter2";
  smtp.from_email = "news@example.com";
  return smtp;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const defaults = SmtpConfig{};
  CHECK_EQ(defaults.max_connections, 5);
  CHECK_EQ(defaults.max_messages, 100);
  CHECK_EQ(defaults.rate_limit_per_minute, 10);
  CHECK_EQ(defaults.connection_timeout.count(), 60000);
  CHECK_EQ(defaults.socket_timeout.count(), 60000);
  CHECK_EQ(defaults.greeting_timeout.count(), 30000);
  CHECK(!defaults.secure);
  CHECK(defaults.enable_tls);
  CHECK(!defaults.require_tls);
  CHECK(!defaults.dkim_enabled());

  TenantEmailConfig config;
  config.tenant_id       = "t1";
  config.provider_config = good_smtp();
  CHECK(config.provider() == Provider::SMTP);
  CHECK(config.smtp() != nullptr);
  CHECK(config.sendgrid() == nullptr);
  CHECK_EQ(config.from_email(), "news@example.com");
  CHECK_EQ(config.smtp()->key(), "smtp.example.com:587:mailer");
  CHECK_EQ(config_error(config), "");

  config.smtp()->password.clear();
  CHECK_EQ(config_error(config), "SMTP configuration requires password");

  config.provider_config = good_smtp();
  config.smtp()->host.clear();
  config.smtp()->port = 0;
  CHECK_EQ(config_error(config), "SMTP configuration requires host");

  config.provider_config = good_smtp();
  config.smtp()->port    = 0;
  CHECK_EQ(config_error(config), "SMTP configuration requires port");

  config.provider_config             = good_smtp();
  config.smtp()->rate_limit_per_minute = 0;
  CHECK_NE(config_error(config), "");

  config.provider_config = good_smtp();
  config.smtp()->dkim    = DkimConfig{true, "", "s1", "example.com"};
  CHECK_EQ(config_error(config), "DKIM configuration requires privateKey");
  config.smtp()->dkim->enabled = false;
  CHECK_EQ(config_error(config), "");

  SendGridConfig sg;
  sg.from_email          = "news@example.com";
  config.provider_config = sg;
  CHECK(config.provider() == Provider::SENDGRID);
  CHECK_EQ(config_error(config), "SendGrid configuration requires apiKey");
  CHECK(!has_usable_api_key(sg));

  sg.api_key             = Config::sendgrid_placeholder_key;
  config.provider_config = sg;
  CHECK_EQ(config_error(config), "");
  CHECK(is_placeholder_key(sg.api_key));
  CHECK(!has_usable_api_key(sg));

  sg.api_key = "SG.real-key";
  CHECK(has_usable_api_key(sg));

  config.tenant_id.clear();
  CHECK_NE(config_error(config), "");

  CHECK_EQ(std::string{provider_c_str(Provider::SENDGRID)}, "SENDGRID");
  CHECK_EQ(std::string{provider_c_str(Provider::SMTP)}, "SMTP");
}
