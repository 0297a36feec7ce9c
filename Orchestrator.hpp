#ifndef ORCHESTRATOR_DOT_HPP
#define ORCHESTRATOR_DOT_HPP

#include "DNS-validate.hpp"
#include "DNS.hpp"
#include "DNSBL.hpp"
#include "Delivery.hpp"
#include "Reputation.hpp"
#include "Router.hpp"
#include "Store.hpp"
#include "TenantConfig.hpp"
#include "Transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Orchestrator {

struct Dns_record {
  std::string name;
  std::string type{"TXT"};
  std::string value;
};

struct Dkim_setup {
  std::string private_key;
  std::string public_key;
  std::string selector;
  Dns_record  dns_record;
};

struct Setup_check {
  bool is_valid{false};

  std::vector<std::string> issues;
  std::vector<std::string> recommendations;

  std::optional<DNS::Setup_guide> dns_validation;
  std::optional<Provider>         provider;

  std::chrono::system_clock::time_point last_checked;
};

// What the rest of the application calls.  Owns nothing; every
// collaborator is handed in and must outlive the Engine.
class Engine {
public:
  Engine(Store::ConfigStore& configs,
         Store::EmailStore&  emails,
         Transport::Pool&    pool,
         Router::Chain&      router,
         Reputation::Scorer& scorer,
         DNS::Resolver&      res);

  // Validate and store, last write wins.  Throws ConfigurationError.
  TenantEmailConfig configure(TenantEmailConfig const& config);

  std::optional<TenantEmailConfig> config(std::string const& tenant_id);

  // Send one message; the email record whose id is msg.correlation_id,
  // if there is one, is marked SENT or FAILED.  Throws ValidationError
  // for a bad recipient and ConfigurationError for a missing or bad
  // tenant configuration; every other failure is a failed result.
  DeliveryResult send(std::string const& tenant_id, Outbound const& msg);

  DNS::Setup_guide
  validate_domain(std::string const&                domain,
                  std::optional<std::string> const& smtp_host = std::nullopt);

  // Throws ConfigurationError when the tenant has no configuration.
  Reputation::Metrics reputation(std::string const& tenant_id);
  Reputation::Sending_recommendations
  sending_recommendations(std::string const& tenant_id);

  std::vector<DNSBL::Listing> check_blacklist(std::string const& domain);

  // A new DKIM key pair.  A tenant on SMTP gets it stored, with signing
  // enabled for its from domain.
  Dkim_setup generate_dkim_key_pair(std::string const& tenant_id);

  Setup_check validate_email_setup(std::string const& tenant_id);

  // Sends a fixed test message through send().  Throws
  // ConfigurationError when the tenant has no configuration.
  DeliveryResult test_configuration(std::string const& tenant_id,
                                    std::string const& test_email);

  // False for an unknown email or one of another tenant.
  bool track_event(std::string const& tenant_id,
                   std::string const& email_id,
                   Store::Event       event,
                   std::string        data = "");

  std::vector<Transport::Stats> connection_stats() const;

  void shutdown();

private:
  TenantEmailConfig config_(std::string const& tenant_id);

  DeliveryResult failed_(TenantEmailConfig const& config,
                         Outbound const&          msg,
                         std::string const&       error);

  Store::ConfigStore& configs_;
  Store::EmailStore&  emails_;
  Transport::Pool&    pool_;
  Router::Chain&      router_;
  Reputation::Scorer& scorer_;
  DNS::Resolver&      res_;
};

} // namespace Orchestrator

#endif // ORCHESTRATOR_DOT_HPP
