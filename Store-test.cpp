#include "Store.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
void check_events()
{
  using Store::Event;
  using Store::map_sendgrid_event;

  CHECK(map_sendgrid_event("delivered") == Event::DELIVERED);
  CHECK(map_sendgrid_event("open") == Event::OPENED);
  CHECK(map_sendgrid_event("CLICK") == Event::CLICKED);
  CHECK(map_sendgrid_event("bounce") == Event::BOUNCED);
  CHECK(map_sendgrid_event("dropped") == Event::DROPPED);
  CHECK(map_sendgrid_event("spamreport") == Event::SPAM_REPORT);
  CHECK(map_sendgrid_event("unsubscribe") == Event::UNSUBSCRIBE);
  CHECK(map_sendgrid_event("deferred") == Event::DEFERRED);
  CHECK(map_sendgrid_event("group_resubscribe") == Event::PROCESSED);
  CHECK(map_sendgrid_event("") == Event::PROCESSED);

  using Store::next_status;
  using Store::Status;
  CHECK(next_status(Status::SENT, Event::DELIVERED) == Status::DELIVERED);
  CHECK(next_status(Status::SENT, Event::BOUNCED) == Status::BOUNCED);
  CHECK(next_status(Status::SENT, Event::DROPPED) == Status::BOUNCED);
  CHECK(next_status(Status::DELIVERED, Event::OPENED) == Status::DELIVERED);
  CHECK(next_status(Status::SENT, Event::DEFERRED) == Status::SENT);

  CHECK_EQ(std::string{Store::status_c_str(Status::FAILED)}, "FAILED");
  CHECK_EQ(std::string{Store::event_c_str(Event::SPAM_REPORT)}, "SPAM_REPORT");
}

void check_configs()
{
  Store::MemoryConfigStore configs;
  CHECK(!configs.get("t1"));

  SendGridConfig sg;
  sg.api_key    = "SG.one";
  sg.from_email = "a@example.com";

  TenantEmailConfig config;
  config.tenant_id       = "t1";
  config.provider_config = sg;
  configs.put(config);
  CHECK(configs.get("t1")->provider() == Provider::SENDGRID);

  SmtpConfig smtp;
  smtp.host       = "smtp.example.com";
  smtp.from_email = "b@example.com";
  config.provider_config = smtp;
  configs.put(config);
  auto const got = configs.get("t1");
  CHECK(got->provider() == Provider::SMTP);
  CHECK_EQ(got->from_email(), "b@example.com");
}

void check_emails()
{
  Store::MemoryEmailStore emails;
  auto const              t0 = std::chrono::system_clock::now();

  Store::Email_record rec;
  rec.id        = "e1";
  rec.tenant_id = "t1";
  rec.to        = "reader@example.net";
  rec.created   = t0;
  emails.put(rec);

  DeliveryResult result;
  result.success       = true;
  result.provider_used = Provider::SENDGRID;
  result.message_id    = "sg-1";

  CHECK(!emails.mark_sent("nope", result));
  CHECK(!emails.mark_failed("nope", "boom"));
  CHECK(!emails.add_event("nope", {Store::Event::OPENED, t0, ""}));

  CHECK(emails.mark_sent("e1", result));
  auto got = emails.get("e1");
  CHECK(got->status == Store::Status::SENT);
  CHECK(got->sent_at);
  CHECK(got->provider == Provider::SENDGRID);
  CHECK_EQ(got->message_id.value(), "sg-1");
  CHECK(got->was_sent());

  CHECK(emails.add_event("e1", {Store::Event::OPENED, t0, "{}"}));
  CHECK(emails.get("e1")->status == Store::Status::SENT);
  CHECK(emails.add_event("e1", {Store::Event::BOUNCED, t0, ""}));
  got = emails.get("e1");
  CHECK(got->status == Store::Status::BOUNCED);
  CHECK_EQ(got->events.size(), 2u);
  CHECK(got->has_event(Store::Event::OPENED));
  CHECK(!got->has_event(Store::Event::CLICKED));

  rec.id = "e2";
  emails.put(rec);
  CHECK(emails.mark_failed("e2", "relay said no"));
  got = emails.get("e2");
  CHECK(got->status == Store::Status::FAILED);
  CHECK_EQ(got->error.value(), "relay said no");
  CHECK(!got->was_sent());

  rec.id      = "e3";
  rec.created = t0 - 40 * 24h;
  emails.put(rec);
  rec.id        = "e4";
  rec.tenant_id = "t2";
  rec.created   = t0;
  emails.put(rec);

  CHECK_EQ(emails.created_since("t1", t0 - 24h).size(), 2u);
  CHECK_EQ(emails.created_since("t1", t0 - 50 * 24h).size(), 3u);
  CHECK_EQ(emails.created_since("t2", t0).size(), 1u);
  CHECK(emails.created_since("t3", t0 - 50 * 24h).empty());
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_events();
  check_configs();
  check_emails();
}
