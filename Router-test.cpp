#include "Router.hpp"

#include "DNS-fake.hpp"
#include "Errors.hpp"

#include <stdexcept>

#include <glog/logging.h>

namespace {
struct Script {
  int  sessions{0};
  int  smtp_sent{0};
  bool smtp_down{false};

  int  api_calls{0};
  bool api_down{false};
  bool api_broken{false}; // client fails outside the HTTP exchange
};

class Fake_session : public SMTP::Session {
public:
  explicit Fake_session(Script& script)
    : script_(script)
  {
  }
  void verify() override
  {
    if (script_.smtp_down)
      throw TransportError("can't connect to relay.example.com:587");
  }
  std::string send(SMTP::Envelope const&) override
  {
    ++script_.smtp_sent;
    return "250 ok";
  }
  void close() override {}

private:
  Script& script_;
};

class Fake_factory : public Transport::SessionFactory {
public:
  explicit Fake_factory(Script& script)
    : script_(script)
  {
  }
  std::unique_ptr<SMTP::Session> create(SmtpConfig const&) override
  {
    ++script_.sessions;
    return std::make_unique<Fake_session>(script_);
  }

private:
  Script& script_;
};

class Fake_api : public SendGrid::Client {
public:
  explicit Fake_api(Script& script)
    : script_(script)
  {
  }
  std::string send(SendGridConfig const& config, Outbound const&) override
  {
    ++script_.api_calls;
    CHECK(has_usable_api_key(config));
    if (script_.api_down)
      throw SendError("SendGrid returned 401: The provided authorization "
                      "grant is invalid, expired, or revoked");
    if (script_.api_broken)
      throw std::invalid_argument("invalid UTF-8 byte at index 4: 0x20");
    return "sg-message-1";
  }

private:
  Script& script_;
};

SmtpConfig smtp(char const* host, char const* from)
{
  SmtpConfig config;
  config.host       = host;
  config.port       = 587;
  config.username   = "mailer";
  config.password   = "secret";
  config.from_email = from;
  return config;
}

TenantEmailConfig sendgrid_tenant(char const* key)
{
  SendGridConfig sg;
  sg.api_key    = key;
  sg.from_email = "news@brand.example";

  TenantEmailConfig config;
  config.tenant_id       = "sg-tenant";
  config.provider_config = sg;
  return config;
}

Outbound message()
{
  Outbound msg;
  msg.to             = "reader@example.net";
  msg.subject        = "Hi";
  msg.content        = "<p>Hi</p>";
  msg.correlation_id = "email-7";
  return msg;
}

struct Rig {
  Script             script;
  DNS::Fake_resolver res;
  Fake_api           api{script};
  Transport::Pool    pool{std::make_unique<Fake_factory>(script)};

  Router::Chain chain(std::optional<SmtpConfig> relay)
  {
    return Router::Chain{pool, api, res, std::move(relay)};
  }
};

void check_smtp_tenant()
{
  Rig rig;
  rig.res.add_txt("tenant.example", "v=spf1 mx ~all");
  auto chain = rig.chain(std::nullopt);

  TenantEmailConfig config;
  config.tenant_id       = "smtp-tenant";
  config.provider_config = smtp("smtp.tenant.example", "news@tenant.example");

  for (auto i = 0; i < 3; ++i) {
    auto const result = chain.send(config, message());
    CHECK(result.success);
    CHECK(result.provider_used == Provider::SMTP);
    // SPF is there, DMARC isn't.
    CHECK_EQ(result.warnings.size(), 1u);
    CHECK_EQ(result.warnings.front().find("No DMARC record found"), 0u);
  }
  CHECK_EQ(rig.script.api_calls, 0);
  CHECK_EQ(rig.script.smtp_sent, 3);
  CHECK(chain.preferred(config) == Provider::SMTP);
}

void check_api_first()
{
  Rig  rig;
  auto chain  = rig.chain(smtp("relay.example.com", "relay@example.com"));
  auto config = sendgrid_tenant("SG.real-key");

  auto const result = chain.send(config, message());
  CHECK(result.success);
  CHECK(result.provider_used == Provider::SENDGRID);
  CHECK_EQ(result.message_id.value(), "sg-message-1");
  CHECK(result.warnings.empty());
  CHECK_EQ(rig.script.api_calls, 1);
  CHECK_EQ(rig.script.sessions, 0);
  CHECK(chain.preferred(config) == Provider::SENDGRID);
}

void check_api_failure_falls_back()
{
  Rig rig;
  rig.script.api_down = true;
  auto chain  = rig.chain(smtp("relay.example.com", "relay@example.com"));
  auto config = sendgrid_tenant("SG.real-key");

  auto const result = chain.send(config, message());
  CHECK(result.success);
  CHECK(result.provider_used == Provider::SMTP);
  CHECK_EQ(rig.script.api_calls, 1);
  CHECK_EQ(rig.script.smtp_sent, 1);
  CHECK_EQ(result.warnings.front().find("SendGrid failed: SendGrid returned "
                                        "401"),
           0u);

  // Nowhere left to go.
  Rig lonely;
  lonely.script.api_down = true;
  auto no_relay          = lonely.chain(std::nullopt);
  auto threw             = false;
  try {
    no_relay.send(config, message());
  }
  catch (NoProviderAvailable const& e) {
    threw = true;
    CHECK_EQ(std::string{e.what()},
             "Neither SendGrid nor SMTP is properly configured.");
  }
  CHECK(threw);
  CHECK_EQ(lonely.script.api_calls, 1);
}

void check_client_error_falls_back()
{
  Rig rig;
  rig.script.api_broken = true;
  auto chain  = rig.chain(smtp("relay.example.com", "relay@example.com"));
  auto config = sendgrid_tenant("SG.real-key");

  auto const result = chain.send(config, message());
  CHECK(result.success);
  CHECK(result.provider_used == Provider::SMTP);
  CHECK_EQ(rig.script.api_calls, 1);
  CHECK_EQ(rig.script.smtp_sent, 1);
  CHECK_EQ(result.warnings.front(),
           "SendGrid failed: invalid UTF-8 byte at index 4: 0x20");
}

void check_placeholder_key()
{
  Rig  rig;
  auto chain  = rig.chain(smtp("relay.example.com", "relay@example.com"));
  auto config = sendgrid_tenant(Config::sendgrid_placeholder_key);

  auto const result = chain.send(config, message());
  CHECK(result.success);
  CHECK(result.provider_used == Provider::SMTP);
  CHECK_EQ(rig.script.api_calls, 0);
  CHECK(chain.preferred(config) == Provider::SMTP);

  // Relay configured but down.
  Rig down;
  down.script.smtp_down = true;
  auto down_chain = down.chain(smtp("relay.example.com", "relay@example.com"));
  auto threw      = false;
  try {
    down_chain.send(config, message());
  }
  catch (NoProviderAvailable const&) {
    threw = true;
  }
  CHECK(threw);
  CHECK_EQ(down.script.api_calls, 0);
  CHECK(!down_chain.preferred(config));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_smtp_tenant();
  check_api_first();
  check_api_failure_falls_back();
  check_client_error_falls_back();
  check_placeholder_key();
}
