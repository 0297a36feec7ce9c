#include "Transport.hpp"

#include "DKIM.hpp"
#include "Errors.hpp"
#include "Message.hpp"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include <fmt/format.h>

namespace Transport {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

std::unique_ptr<SMTP::Session>
SmtpSessionFactory::create(SmtpConfig const& config)
{
  if (config.dkim_enabled())
    DKIM::check_key(*config.dkim);
  return std::make_unique<SMTP::Client>(config, SMTP::helo_name());
}

int reputation_score(long total_sent, long total_failed, double average_ms)
{
  auto const attempts = total_sent + total_failed;
  if (attempts == 0)
    return 50;

  auto const success_rate = static_cast<double>(total_sent) / attempts;
  auto const delivery_time_score
      = std::min(100.0, Config::speed_scale
                            / (average_ms > 0.0 ? average_ms : 1000.0));

  auto const score = std::lround(success_rate * Config::success_weight
                                 + delivery_time_score / 100.0
                                       * Config::speed_weight);
  return static_cast<int>(std::clamp(score, 0L, 100L));
}

Pool::Pool(std::unique_ptr<SessionFactory> factory, Clock clock)
  : factory_(std::move(factory))
  , clock_(std::move(clock))
{
  CHECK(factory_);
}

Pool::~Pool() { shutdown(); }

std::shared_ptr<Pool::Entry> Pool::entry_(std::string const& key)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = entries_[key];
  if (!entry)
    entry = std::make_shared<Entry>();
  return entry;
}

std::shared_ptr<SMTP::Session> Pool::session_(Entry&            entry,
                                              SmtpConfig const& config)
{
  std::lock_guard<std::mutex> lock(entry.session_mutex);
  if (entry.session) {
    if (entry.session_config == config)
      return entry.session;

    LOG(INFO) << "configuration for " << config.key()
              << " changed, replacing its session";
    entry.session->close();
    entry.session.reset();
  }

  LOG(INFO) << "creating session for " << config.key();
  std::shared_ptr<SMTP::Session> session = factory_->create(config);
  session->verify();
  entry.session        = session;
  entry.session_config = config;
  return session;
}

void Pool::admit_(Entry& entry, SmtpConfig const& config)
{
  std::lock_guard<std::mutex> lock(entry.mutex);

  entry.rate_limit_per_minute = config.rate_limit_per_minute;

  auto const now          = clock_();
  auto const window_start = now - Config::rate_window;
  while (!entry.recent.empty() && entry.recent.front() <= window_start)
    entry.recent.pop_front();

  if (static_cast<int>(entry.recent.size()) >= entry.rate_limit_per_minute) {
    auto const wait = std::max(
        milliseconds(0),
        duration_cast<milliseconds>(entry.recent.front() + Config::rate_window
                                    - now));
    auto const secs = (wait.count() + 999) / 1000;
    LOG(WARNING) << "rate limit for " << config.key() << " reached, "
                 << entry.recent.size() << " sends in the last minute";
    throw RateLimitError(
        fmt::format("Rate limit exceeded. Wait {} seconds.", secs), wait);
  }

  entry.recent.push_back(now);
}

int Pool::record_(Entry& entry, bool success, milliseconds time)
{
  std::lock_guard<std::mutex> lock(entry.mutex);
  if (success) {
    ++entry.total_sent;
    entry.average_delivery_time_ms
        = (entry.average_delivery_time_ms * (entry.total_sent - 1)
           + time.count())
          / entry.total_sent;
  }
  else {
    ++entry.total_failed;
    entry.reputation
        = std::max(0, entry.reputation - Config::failure_penalty);
  }
  return reputation_score(entry.total_sent, entry.total_failed,
                          entry.average_delivery_time_ms);
}

std::shared_ptr<SMTP::Session> Pool::acquire(SmtpConfig const& config)
{
  return session_(*entry_(config.key()), config);
}

DeliveryResult Pool::send(SmtpConfig const& config, Outbound const& msg)
{
  auto const start = std::chrono::steady_clock::now();
  auto const entry = entry_(config.key());

  admit_(*entry, config);

  auto result{DeliveryResult{}};
  result.provider_used = Provider::SMTP;

  try {
    auto const session = session_(*entry, config);

    auto eml = Message::compose(config, msg);
    if (config.dkim_enabled())
      Message::sign(eml, *config.dkim);

    auto const reply = session->send(
        SMTP::Envelope{config.from_email, {msg.to}, eml.as_string()});

    result.success    = true;
    result.message_id = eml.hdr("Message-ID");
    LOG(INFO) << "sent " << *result.message_id << " to " << msg.to << " via "
              << config.key() << ": " << reply;
  }
  catch (TransportError const& e) {
    LOG(WARNING) << "no session for " << config.key() << ": " << e.what();
    result.error = e.what();
  }
  catch (SendError const& e) {
    LOG(WARNING) << "send to " << msg.to << " via " << config.key()
                 << " failed: " << e.what();
    result.error = e.what();
  }

  result.delivery_time = duration_cast<milliseconds>(
      std::chrono::steady_clock::now() - start);
  result.reputation_score
      = record_(*entry, result.success, result.delivery_time);

  return result;
}

bool Pool::is_available(SmtpConfig const& config)
{
  try {
    acquire(config);
    return true;
  }
  catch (TransportError const& e) {
    LOG(WARNING) << config.key() << " is not available: " << e.what();
  }
  return false;
}

Stats Pool::stats_(std::string const& key, Entry& entry) const
{
  std::lock_guard<std::mutex> lock(entry.mutex);

  auto const window_start = clock_() - Config::rate_window;

  Stats s;
  s.key                      = key;
  s.total_sent               = entry.total_sent;
  s.total_failed             = entry.total_failed;
  s.average_delivery_time_ms = entry.average_delivery_time_ms;
  if (auto const attempts = entry.total_sent + entry.total_failed; attempts)
    s.success_rate = static_cast<double>(entry.total_sent) / attempts;
  s.reputation       = entry.reputation;
  s.reputation_score = reputation_score(entry.total_sent, entry.total_failed,
                                        entry.average_delivery_time_ms);
  s.recent_sends     = static_cast<int>(
      std::count_if(begin(entry.recent), end(entry.recent),
                    [window_start](auto t) { return t > window_start; }));
  s.rate_limit_per_minute = entry.rate_limit_per_minute;
  return s;
}

std::vector<Stats> Pool::stats() const
{
  std::map<std::string, std::shared_ptr<Entry>> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries = entries_;
  }

  std::vector<Stats> all;
  for (auto const& [key, entry] : entries)
    all.push_back(stats_(key, *entry));
  return all;
}

Stats Pool::stats(std::string const& key) const
{
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto const it = entries_.find(key);
    if (it == entries_.end()) {
      Stats s;
      s.key              = key;
      s.reputation_score = reputation_score(0, 0, 0.0);
      return s;
    }
    entry = it->second;
  }
  return stats_(key, *entry);
}

void Pool::shutdown()
{
  std::map<std::string, std::shared_ptr<Entry>> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.swap(entries_);
  }

  for (auto const& [key, entry] : entries) {
    std::lock_guard<std::mutex> lock(entry->session_mutex);
    if (entry->session) {
      LOG(INFO) << "closing session for " << key;
      entry->session->close();
      entry->session.reset();
    }
  }
}

} // namespace Transport
