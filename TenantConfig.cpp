#include "TenantConfig.hpp"

#include "Errors.hpp"

#include <fmt/format.h>

namespace {
void require(bool present, char const* kind, char const* field)
{
  if (!present)
    throw ConfigurationError(
        fmt::format("{} configuration requires {}", kind, field));
}
} // namespace

std::string SmtpConfig::key() const
{
  return fmt::format("{}:{}:{}", host, port, username);
}

std::string const& TenantEmailConfig::from_email() const
{
  return std::visit(
      [](auto const& cfg) -> std::string const& { return cfg.from_email; },
      provider_config);
}

void validate(SendGridConfig const& config)
{
  require(!config.api_key.empty(), "SendGrid", "apiKey");
  require(!config.from_email.empty(), "SendGrid", "fromEmail");
}

void validate(SmtpConfig const& config)
{
  require(!config.host.empty(), "SMTP", "host");
  require(config.port != 0, "SMTP", "port");
  require(!config.username.empty(), "SMTP", "username");
  require(!config.password.empty(), "SMTP", "password");
  require(!config.from_email.empty(), "SMTP", "fromEmail");

  require(config.max_connections > 0, "SMTP", "maxConnections > 0");
  require(config.max_messages > 0, "SMTP", "maxMessages > 0");
  require(config.rate_limit_per_minute > 0, "SMTP", "rateLimitPerMinute > 0");

  require(config.connection_timeout.count() > 0, "SMTP",
          "connectionTimeout > 0");
  require(config.socket_timeout.count() > 0, "SMTP", "socketTimeout > 0");
  require(config.greeting_timeout.count() > 0, "SMTP", "greetingTimeout > 0");

  if (config.dkim_enabled()) {
    require(!config.dkim->private_key.empty(), "DKIM", "privateKey");
    require(!config.dkim->selector.empty(), "DKIM", "selector");
    require(!config.dkim->domain.empty(), "DKIM", "domain");
  }
}

void validate(TenantEmailConfig const& config)
{
  if (config.tenant_id.empty())
    throw ConfigurationError("tenant id is required");

  std::visit([](auto const& cfg) { validate(cfg); }, config.provider_config);
}

bool is_placeholder_key(std::string_view key)
{
  return key == Config::sendgrid_placeholder_key;
}

bool has_usable_api_key(SendGridConfig const& config)
{
  return !config.api_key.empty() && !is_placeholder_key(config.api_key);
}
