#ifndef STORE_DOT_HPP
#define STORE_DOT_HPP

#include "Delivery.hpp"
#include "TenantConfig.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Store {

enum class Status : uint8_t {
  SCHEDULED,
  SENT,
  DELIVERED,
  BOUNCED,
  FAILED,
};

constexpr char const* status_c_str(Status status)
{
  switch (status) {
  case Status::SCHEDULED: return "SCHEDULED";
  case Status::SENT: return "SENT";
  case Status::DELIVERED: return "DELIVERED";
  case Status::BOUNCED: return "BOUNCED";
  case Status::FAILED: return "FAILED";
  }
  return "*** unknown Status ***";
}

enum class Event : uint8_t {
  PROCESSED,
  DELIVERED,
  OPENED,
  CLICKED,
  BOUNCED,
  DROPPED,
  SPAM_REPORT,
  UNSUBSCRIBE,
  DEFERRED,
};

constexpr char const* event_c_str(Event event)
{
  switch (event) {
  case Event::PROCESSED: return "PROCESSED";
  case Event::DELIVERED: return "DELIVERED";
  case Event::OPENED: return "OPENED";
  case Event::CLICKED: return "CLICKED";
  case Event::BOUNCED: return "BOUNCED";
  case Event::DROPPED: return "DROPPED";
  case Event::SPAM_REPORT: return "SPAM_REPORT";
  case Event::UNSUBSCRIBE: return "UNSUBSCRIBE";
  case Event::DEFERRED: return "DEFERRED";
  }
  return "*** unknown Event ***";
}

// SendGrid webhook event names; anything unrecognized is PROCESSED.
Event map_sendgrid_event(std::string_view name);

// The record status after event, or the same status.
Status next_status(Status status, Event event);

struct Event_record {
  Event                                 type;
  std::chrono::system_clock::time_point timestamp;
  std::string                           data;
};

// One row of the lead/email table this core reads and updates.
struct Email_record {
  std::string id;
  std::string tenant_id;
  std::string to;
  std::string subject;

  Status status{Status::SCHEDULED};

  std::chrono::system_clock::time_point                created;
  std::optional<std::chrono::system_clock::time_point> sent_at;

  std::optional<Provider>    provider;
  std::optional<std::string> message_id;
  std::optional<std::string> error;

  std::vector<Event_record> events;

  bool has_event(Event type) const;

  // SENT, DELIVERED or BOUNCED: it left us at some point.
  bool was_sent() const;
};

class ConfigStore {
public:
  virtual ~ConfigStore() = default;

  virtual std::optional<TenantEmailConfig> get(std::string const& tenant_id)
      = 0;

  // Upsert; the last write for a tenant wins.
  virtual void put(TenantEmailConfig const& config) = 0;
};

class EmailStore {
public:
  virtual ~EmailStore() = default;

  virtual void                        put(Email_record const& rec) = 0;
  virtual std::optional<Email_record> get(std::string const& id)   = 0;

  // False when there is no such record.
  virtual bool mark_sent(std::string const& id, DeliveryResult const& result)
      = 0;
  virtual bool mark_failed(std::string const& id, std::string const& error) = 0;

  // Appends the event and moves the status along.  False when there is
  // no such record.
  virtual bool add_event(std::string const& id, Event_record const& event) = 0;

  // A tenant's records created at or after since.
  virtual std::vector<Email_record>
  created_since(std::string const&                    tenant_id,
                std::chrono::system_clock::time_point since)
      = 0;
};

// In-process stores for tools and tests.
class MemoryConfigStore : public ConfigStore {
public:
  std::optional<TenantEmailConfig> get(std::string const& tenant_id) override;
  void put(TenantEmailConfig const& config) override;

private:
  std::mutex                               mutex_;
  std::map<std::string, TenantEmailConfig> configs_;
};

class MemoryEmailStore : public EmailStore {
public:
  void                        put(Email_record const& rec) override;
  std::optional<Email_record> get(std::string const& id) override;

  bool mark_sent(std::string const& id, DeliveryResult const& result) override;
  bool mark_failed(std::string const& id, std::string const& error) override;
  bool add_event(std::string const& id, Event_record const& event) override;

  std::vector<Email_record>
  created_since(std::string const&                    tenant_id,
                std::chrono::system_clock::time_point since) override;

private:
  std::mutex                          mutex_;
  std::map<std::string, Email_record> records_;
};

} // namespace Store

#endif // STORE_DOT_HPP
