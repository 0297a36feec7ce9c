#include "Transport.hpp"

#include "Errors.hpp"

#include <atomic>
#include <thread>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
// What the fake sessions of one test share.
struct Script {
  std::atomic<int> created{0};
  std::atomic<int> verified{0};
  std::atomic<int> sent{0};
  std::atomic<int> closed{0};

  std::atomic<bool> unreachable{false};
  std::atomic<bool> reject{false};
};

class Fake_session : public SMTP::Session {
public:
  explicit Fake_session(Script& script)
    : script_(script)
  {
  }

  void verify() override
  {
    if (script_.unreachable)
      throw TransportError("can't connect to smtp.example.com:587");
    ++script_.verified;
  }

  std::string send(SMTP::Envelope const& envelope) override
  {
    CHECK_EQ(envelope.rcpt_to.size(), 1u);
    CHECK_NE(envelope.data.find("\r\n\r\n"), std::string::npos);
    if (script_.reject)
      throw SendError("recipient «" + envelope.rcpt_to.front()
                      + "» rejected: 550 no such user");
    ++script_.sent;
    return "250 2.0.0 queued";
  }

  void close() override { ++script_.closed; }

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
    ++script_.created;
    return std::make_unique<Fake_session>(script_);
  }

private:
  Script& script_;
};

struct Fake_clock {
  std::chrono::system_clock::time_point now{
      std::chrono::system_clock::time_point{} + 1'000'000s};

  Transport::Clock clock()
  {
    return [this] { return now; };
  }
};

SmtpConfig smtp(char const* user = "mailer", int limit = 3)
{
  SmtpConfig config;
  config.host                  = "smtp.example.com";
  config.port                  = 587;
  config.username              = user;
  config.password              = "secret";
  config.from_email            = "news@example.com";
  config.rate_limit_per_minute = limit;
  return config;
}

Outbound message()
{
  Outbound msg;
  msg.to             = "reader@example.net";
  msg.subject        = "Hello";
  msg.content        = "<p>Hello</p>";
  msg.correlation_id = "c-1";
  return msg;
}

void check_score()
{
  using Transport::reputation_score;
  CHECK_EQ(reputation_score(0, 0, 0.0), 50);
  CHECK_EQ(reputation_score(10, 0, 1000.0), 100);
  CHECK_EQ(reputation_score(10, 0, 2000.0), 85);
  CHECK_EQ(reputation_score(10, 0, 10.0), 100); // speed tops out
  CHECK_EQ(reputation_score(5, 5, 1000.0), 65);
  CHECK_EQ(reputation_score(0, 7, 0.0), 30);
  CHECK_EQ(reputation_score(1, 1'000'000, 1e9), 0);
}

void check_rate_limit()
{
  Script     script;
  Fake_clock fc;

  Transport::Pool pool{std::make_unique<Fake_factory>(script), fc.clock()};
  auto const      config = smtp("mailer", 3);

  CHECK(pool.send(config, message()).success);
  fc.now += 10s;
  CHECK(pool.send(config, message()).success);
  CHECK(pool.send(config, message()).success);

  fc.now += 5s;
  auto limited = false;
  try {
    pool.send(config, message());
  }
  catch (RateLimitError const& e) {
    limited = true;
    // The first send leaves the window 45 seconds from now.
    CHECK_EQ(e.wait().count(), 45'000);
    CHECK_EQ(std::string{e.what()}, "Rate limit exceeded. Wait 45 seconds.");
  }
  CHECK(limited);
  CHECK_EQ(script.sent, 3); // nothing reached the session

  auto const s = pool.stats(config.key());
  CHECK_EQ(s.total_sent, 3);
  CHECK_EQ(s.total_failed, 0);
  CHECK_EQ(s.recent_sends, 3);
  CHECK_EQ(s.rate_limit_per_minute, 3);

  // One more once the first send leaves the window, and only one.
  fc.now += 45s;
  CHECK(pool.send(config, message()).success);
  limited = false;
  try {
    pool.send(config, message());
  }
  catch (RateLimitError const& e) {
    limited = true;
    CHECK_EQ(e.wait().count(), 10'000);
  }
  CHECK(limited);

  // Another key has its own window.
  CHECK(pool.send(smtp("other", 3), message()).success);
  CHECK_EQ(script.created, 2);
}

void check_concurrent_admission()
{
  Script          script;
  Transport::Pool pool{std::make_unique<Fake_factory>(script)};
  auto const      config = smtp("busy", 10);

  std::atomic<int> ok{0};
  std::atomic<int> limited{0};

  std::vector<std::thread> threads;
  for (auto i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      for (auto j = 0; j < 5; ++j) {
        try {
          if (pool.send(config, message()).success)
            ++ok;
        }
        catch (RateLimitError const&) {
          ++limited;
        }
      }
    });
  }
  for (auto& t : threads)
    t.join();

  CHECK_EQ(ok, 10);
  CHECK_EQ(limited, 10);
  CHECK_EQ(script.created, 1);
  CHECK_EQ(pool.stats(config.key()).total_sent, 10);
}

// SMTP host unreachable when the session is first needed.
void check_unreachable()
{
  Script script;
  script.unreachable = true;

  Transport::Pool pool{std::make_unique<Fake_factory>(script)};
  auto const      config = smtp();

  CHECK(!pool.is_available(config));

  auto const result = pool.send(config, message());
  CHECK(!result.success);
  CHECK(result.provider_used == Provider::SMTP);
  CHECK_EQ(result.error.value(), "can't connect to smtp.example.com:587");
  CHECK(!result.message_id);

  auto const s = pool.stats(config.key());
  CHECK_EQ(s.total_failed, 1);
  CHECK_EQ(s.total_sent, 0);
  CHECK_EQ(s.reputation, 95);
  CHECK_EQ(result.reputation_score.value(), s.reputation_score);

  // Comes back once the server does.
  script.unreachable = false;
  CHECK(pool.is_available(config));
  CHECK(pool.send(config, message()).success);
  CHECK_EQ(pool.stats(config.key()).success_rate, 0.5);
}

void check_rejected()
{
  Script script;
  script.reject = true;

  Transport::Pool pool{std::make_unique<Fake_factory>(script)};
  auto const      config = smtp("mailer", 100);

  for (auto i = 0; i < 25; ++i) {
    auto const result = pool.send(config, message());
    CHECK(!result.success);
    CHECK_NE(result.error->find("rejected"), std::string::npos);
  }
  auto const s = pool.stats(config.key());
  CHECK_EQ(s.total_failed, 25);
  CHECK_EQ(s.reputation, 0); // floor
}

void check_sessions()
{
  Script          script;
  Transport::Pool pool{std::make_unique<Fake_factory>(script)};
  auto const      config = smtp("mailer", 100);

  auto const s1 = pool.acquire(config);
  auto const s2 = pool.acquire(config);
  CHECK_EQ(s1.get(), s2.get());
  CHECK_EQ(script.created, 1);
  CHECK_EQ(script.verified, 1);

  auto const result = pool.send(config, message());
  CHECK(result.success);
  CHECK(result.message_id);
  CHECK_NE(result.message_id->find("@example.com>"), std::string::npos);
  CHECK_EQ(script.created, 1);

  CHECK_EQ(pool.stats().size(), 1u);

  pool.shutdown();
  CHECK_EQ(script.closed, 1);
  CHECK(pool.stats().empty());
  CHECK_EQ(pool.stats(config.key()).reputation_score, 50);
  CHECK_EQ(pool.stats(config.key()).total_sent, 0);

  pool.shutdown();
  CHECK_EQ(script.closed, 1);

  // A fresh session after shutdown.
  CHECK(pool.send(config, message()).success);
  CHECK_EQ(script.created, 2);
}

void check_reconfigured()
{
  Script          script;
  Transport::Pool pool{std::make_unique<Fake_factory>(script)};
  auto            config = smtp("mailer", 100);

  CHECK(pool.send(config, message()).success);
  CHECK(pool.send(config, message()).success);
  CHECK_EQ(script.created, 1);

  // New password, same host, port and user.
  config.password = "rotated";
  auto const key  = config.key();
  CHECK(pool.send(config, message()).success);
  CHECK_EQ(script.created, 2);
  CHECK_EQ(script.verified, 2);
  CHECK_EQ(script.closed, 1);
  CHECK_EQ(config.key(), key);

  config.require_tls = true;
  auto const s1      = pool.acquire(config);
  CHECK_EQ(script.created, 3);
  CHECK_EQ(pool.acquire(config).get(), s1.get());
  CHECK_EQ(script.created, 3);

  // Stats stay with the key.
  CHECK_EQ(pool.stats(key).total_sent, 3);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_score();
  check_rate_limit();
  check_concurrent_admission();
  check_unreachable();
  check_rejected();
  check_sessions();
  check_reconfigured();
}
