#include "Store.hpp"

#include "iequal.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace Store {

Event map_sendgrid_event(std::string_view name)
{
  // clang-format off
  static constexpr std::pair<char const*, Event> names[]{
      {"processed",   Event::PROCESSED},
      {"delivered",   Event::DELIVERED},
      {"open",        Event::OPENED},
      {"click",       Event::CLICKED},
      {"bounce",      Event::BOUNCED},
      {"dropped",     Event::DROPPED},
      {"spamreport",  Event::SPAM_REPORT},
      {"unsubscribe", Event::UNSUBSCRIBE},
      {"deferred",    Event::DEFERRED},
  };
  // clang-format on

  for (auto const& [sg_name, event] : names) {
    if (iequal(name, sg_name))
      return event;
  }
  LOG(INFO) << "unknown SendGrid event «" << name << "»";
  return Event::PROCESSED;
}

Status next_status(Status status, Event event)
{
  switch (event) {
  case Event::DELIVERED: return Status::DELIVERED;
  case Event::BOUNCED:
  case Event::DROPPED: return Status::BOUNCED;
  default: return status;
  }
}

bool Email_record::has_event(Event type) const
{
  return std::any_of(begin(events), end(events),
                     [type](auto const& ev) { return ev.type == type; });
}

bool Email_record::was_sent() const
{
  return status == Status::SENT || status == Status::DELIVERED
         || status == Status::BOUNCED;
}

std::optional<TenantEmailConfig>
MemoryConfigStore::get(std::string const& tenant_id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto const it = configs_.find(tenant_id);
  if (it == configs_.end())
    return {};
  return it->second;
}

void MemoryConfigStore::put(TenantEmailConfig const& config)
{
  std::lock_guard<std::mutex> lock(mutex_);
  configs_.insert_or_assign(config.tenant_id, config);
}

void MemoryEmailStore::put(Email_record const& rec)
{
  std::lock_guard<std::mutex> lock(mutex_);
  records_.insert_or_assign(rec.id, rec);
}

std::optional<Email_record> MemoryEmailStore::get(std::string const& id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto const it = records_.find(id);
  if (it == records_.end())
    return {};
  return it->second;
}

bool MemoryEmailStore::mark_sent(std::string const&    id,
                                 DeliveryResult const& result)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto const it = records_.find(id);
  if (it == records_.end())
    return false;
  auto& rec      = it->second;
  rec.status     = Status::SENT;
  rec.sent_at    = std::chrono::system_clock::now();
  rec.provider   = result.provider_used;
  rec.message_id = result.message_id;
  rec.error.reset();
  return true;
}

bool MemoryEmailStore::mark_failed(std::string const& id,
                                   std::string const& error)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto const it = records_.find(id);
  if (it == records_.end())
    return false;
  it->second.status = Status::FAILED;
  it->second.error  = error;
  return true;
}

bool MemoryEmailStore::add_event(std::string const&  id,
                                 Event_record const& event)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto const it = records_.find(id);
  if (it == records_.end())
    return false;
  auto& rec = it->second;
  rec.events.push_back(event);
  rec.status = next_status(rec.status, event.type);
  return true;
}

std::vector<Email_record>
MemoryEmailStore::created_since(std::string const&                    tenant_id,
                                std::chrono::system_clock::time_point since)
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Email_record>   recs;
  for (auto const& [id, rec] : records_) {
    if (rec.tenant_id == tenant_id && rec.created >= since)
      recs.push_back(rec);
  }
  return recs;
}

} // namespace Store
