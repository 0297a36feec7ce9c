#ifndef SENDGRID_DOT_HPP
#define SENDGRID_DOT_HPP

#include "Delivery.hpp"
#include "TenantConfig.hpp"

#include <chrono>
#include <string>

namespace Config {
constexpr char sendgrid_endpoint_default[]
    = "https://api.sendgrid.com/v3/mail/send";
constexpr auto sendgrid_timeout = std::chrono::seconds(30);
} // namespace Config

namespace SendGrid {

// The v3 mail/send HTTP API.
class Client {
public:
  virtual ~Client() = default;

  // The X-Message-Id of the accepted message.  Throws SendError on any
  // failure, credentials and quota included.
  virtual std::string send(SendGridConfig const& config,
                           Outbound const&       msg) = 0;
};

class CurlClient : public Client {
public:
  CurlClient();

  std::string send(SendGridConfig const& config, Outbound const& msg) override;

private:
  std::string endpoint_;
};

// JSON request body for one message, open and click tracking on.
std::string request_body(SendGridConfig const& config, Outbound const& msg);

// The first "errors[].message" of an API error body, else the body.
std::string error_message(std::string const& body);

} // namespace SendGrid

#endif // SENDGRID_DOT_HPP
