#ifndef TRANSPORT_DOT_HPP
#define TRANSPORT_DOT_HPP

#include "Delivery.hpp"
#include "Send.hpp"
#include "TenantConfig.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Config {
constexpr auto rate_window = std::chrono::seconds(60);

constexpr int failure_penalty{5};
constexpr int reputation_start{100};

// reputationScore = successRate * 70 + deliveryTimeScore * 30
constexpr double success_weight{70.0};
constexpr double speed_weight{30.0};

// deliveryTimeScore = min(100, speed_scale / averageDeliveryTimeMs)
constexpr double speed_scale{100'000.0};
} // namespace Config

namespace Transport {

using Clock = std::function<std::chrono::system_clock::time_point()>;

// Makes the session for one pool key.
class SessionFactory {
public:
  virtual ~SessionFactory() = default;

  // Throws ConfigurationError for a bad DKIM key.
  virtual std::unique_ptr<SMTP::Session> create(SmtpConfig const& config) = 0;
};

// Real SMTP sessions, DKIM key checked up front.
class SmtpSessionFactory : public SessionFactory {
public:
  std::unique_ptr<SMTP::Session> create(SmtpConfig const& config) override;
};

struct Stats {
  std::string key;

  long total_sent{0};
  long total_failed{0};

  double average_delivery_time_ms{0.0};
  double success_rate{0.0}; // 0 to 1

  int reputation{Config::reputation_start}; // local counter, 0 to 100
  int reputation_score{0};                  // 0 to 100

  int recent_sends{0};
  int rate_limit_per_minute{0};
};

// Pooled, rate limited SMTP sessions keyed by "host:port:username".
// Safe for concurrent callers.
class Pool {
public:
  Pool(Pool const&) = delete;
  Pool& operator=(Pool const&) = delete;

  explicit Pool(std::unique_ptr<SessionFactory> factory,
                Clock clock = std::chrono::system_clock::now);
  ~Pool();

  // The session for config.key(), created and verified on first use,
  // and replaced when any other setting for the key has changed.
  // Throws TransportError or ConfigurationError.
  std::shared_ptr<SMTP::Session> acquire(SmtpConfig const& config);

  // Admission control, then compose, sign and send one message.
  // Throws RateLimitError when the key's window is full; every other
  // failure comes back as a failed result.
  DeliveryResult send(SmtpConfig const& config, Outbound const& msg);

  // False when acquire() fails with a TransportError.
  bool is_available(SmtpConfig const& config);

  std::vector<Stats> stats() const;
  Stats              stats(std::string const& key) const;

  // Close every session and forget all stats.  Idempotent.
  void shutdown();

private:
  struct Entry {
    std::mutex                     session_mutex;
    std::shared_ptr<SMTP::Session> session;
    SmtpConfig                     session_config; // session was made from it

    std::mutex mutex; // guards everything below

    std::deque<std::chrono::system_clock::time_point> recent;

    long   total_sent{0};
    long   total_failed{0};
    double average_delivery_time_ms{0.0};
    int    reputation{Config::reputation_start};
    int    rate_limit_per_minute{Config::rate_limit_per_minute_default};
  };

  std::shared_ptr<Entry> entry_(std::string const& key);

  std::shared_ptr<SMTP::Session> session_(Entry& entry, SmtpConfig const& config);

  void admit_(Entry& entry, SmtpConfig const& config);
  int  record_(Entry& entry, bool success, std::chrono::milliseconds time);

  Stats stats_(std::string const& key, Entry& entry) const;

  std::unique_ptr<SessionFactory> factory_;
  Clock                           clock_;

  mutable std::mutex                            mutex_; // guards entries_
  std::map<std::string, std::shared_ptr<Entry>> entries_;
};

// successRate * 70 plus deliveryTimeScore scaled to 30, where
// deliveryTimeScore = min(100, 100000 / averageMs); 50 before any
// attempt, always 0 to 100.
int reputation_score(long total_sent, long total_failed, double average_ms);

} // namespace Transport

#endif // TRANSPORT_DOT_HPP
