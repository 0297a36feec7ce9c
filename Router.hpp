#ifndef ROUTER_DOT_HPP
#define ROUTER_DOT_HPP

#include "DNS.hpp"
#include "Delivery.hpp"
#include "SendGrid.hpp"
#include "TenantConfig.hpp"
#include "Transport.hpp"

#include <optional>

namespace Router {

// The process wide SMTP relay from --smtp_host and friends, or their
// DELIVERD_SMTP_* environment variables.  Empty unless host, user and
// password are all set.
std::optional<SmtpConfig> relay_config();

// SendGrid first when the tenant chose it and has a real key, then the
// SMTP relay; a tenant on SMTP goes straight to its own server.  Each
// provider is tried at most once.
class Chain {
public:
  Chain(Transport::Pool&          pool,
        SendGrid::Client&         api,
        DNS::Resolver&            res,
        std::optional<SmtpConfig> relay = relay_config());

  // Throws NoProviderAvailable when nothing is left to try, and lets
  // RateLimitError and ConfigurationError through.  Any other failure
  // is a failed result.
  DeliveryResult send(TenantEmailConfig const& config, Outbound const& msg);

  // What send() would try first, if anything.
  std::optional<Provider> preferred(TenantEmailConfig const& config);

  std::optional<SmtpConfig> const& relay() const { return relay_; }

private:
  DeliveryResult send_smtp_(SmtpConfig const& config, Outbound const& msg);

  Transport::Pool&          pool_;
  SendGrid::Client&         api_;
  DNS::Resolver&            res_;
  std::optional<SmtpConfig> relay_;
};

} // namespace Router

#endif // ROUTER_DOT_HPP
