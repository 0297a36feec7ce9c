#ifndef TENANTCONFIG_DOT_HPP
#define TENANTCONFIG_DOT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Config {
constexpr int max_connections_default{5};
constexpr int max_messages_default{100};
constexpr int rate_limit_per_minute_default{10};

constexpr auto connection_timeout_default = std::chrono::milliseconds(60'000);
constexpr auto socket_timeout_default     = std::chrono::milliseconds(60'000);
constexpr auto greeting_timeout_default   = std::chrono::milliseconds(30'000);

// What the settings form ships with; never a real key.
constexpr char sendgrid_placeholder_key[] = "SG.your-actual-sendgrid-api-key";
} // namespace Config

enum class Provider : bool {
  SENDGRID,
  SMTP,
};

constexpr char const* provider_c_str(Provider provider)
{
  switch (provider) {
  case Provider::SENDGRID: return "SENDGRID";
  case Provider::SMTP: return "SMTP";
  }
  return "*** unknown Provider ***";
}

struct DkimConfig {
  bool        enabled{false};
  std::string private_key; // PEM
  std::string selector;
  std::string domain;

  bool operator==(DkimConfig const&) const = default;
};

struct SendGridConfig {
  std::string                api_key;
  std::string                from_email;
  std::string                from_name;
  std::optional<std::string> webhook_url;
};

struct SmtpConfig {
  std::string host;
  uint16_t    port{0};
  bool        secure{false}; // TLS from the first byte, port 465 style

  std::string username;
  std::string password;

  std::string                from_email;
  std::string                from_name;
  std::optional<std::string> reply_to;

  std::optional<DkimConfig> dkim;

  int max_connections{Config::max_connections_default};
  int max_messages{Config::max_messages_default};
  int rate_limit_per_minute{Config::rate_limit_per_minute_default};

  std::chrono::milliseconds connection_timeout{
      Config::connection_timeout_default};
  std::chrono::milliseconds socket_timeout{Config::socket_timeout_default};
  std::chrono::milliseconds greeting_timeout{
      Config::greeting_timeout_default};

  std::optional<std::string> static_ip; // local address to bind

  bool enable_tls{true};
  bool require_tls{false};

  // Pool key, "host:port:username".
  std::string key() const;

  bool dkim_enabled() const { return dkim && dkim->enabled; }

  bool operator==(SmtpConfig const&) const = default;
};

using ProviderConfig = std::variant<SendGridConfig, SmtpConfig>;

struct TenantEmailConfig {
  std::string    tenant_id;
  ProviderConfig provider_config;

  Provider provider() const
  {
    return std::holds_alternative<SendGridConfig>(provider_config)
               ? Provider::SENDGRID
               : Provider::SMTP;
  }

  SendGridConfig const* sendgrid() const
  {
    return std::get_if<SendGridConfig>(&provider_config);
  }
  SmtpConfig const* smtp() const
  {
    return std::get_if<SmtpConfig>(&provider_config);
  }
  SmtpConfig* smtp() { return std::get_if<SmtpConfig>(&provider_config); }

  std::string const& from_email() const;
};

// Throw ConfigurationError naming the first missing or bad field.
void validate(SendGridConfig const& config);
void validate(SmtpConfig const& config);
void validate(TenantEmailConfig const& config);

// An API key is usable when present and not the shipped placeholder.
bool has_usable_api_key(SendGridConfig const& config);
bool is_placeholder_key(std::string_view key);

#endif // TENANTCONFIG_DOT_HPP
