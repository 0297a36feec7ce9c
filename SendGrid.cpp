#include "SendGrid.hpp"

#include "Errors.hpp"
#include "Message.hpp"
#include "iequal.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>

#include <curl/curl.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

DEFINE_string(sendgrid_endpoint,
              Config::sendgrid_endpoint_default,
              "SendGrid mail send URL");

using json = nlohmann::json;

namespace {
std::once_flag curl_init;

struct Exchange {
  std::string body;
  std::string message_id;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  auto const ex = static_cast<Exchange*>(userdata);
  ex->body.append(ptr, size * nmemb);
  return size * nmemb;
}

// Picks "X-Message-Id: ..." out of the response header lines.
size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  auto const ex = static_cast<Exchange*>(userdata);
  auto const len = size * nmemb;

  std::string_view line{ptr, len};
  constexpr std::string_view name{"X-Message-Id:"};
  if (istarts_with(line, name)) {
    line.remove_prefix(name.size());
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
      line.remove_prefix(1);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'
                             || line.back() == ' '))
      line.remove_suffix(1);
    ex->message_id = std::string{line};
  }
  return len;
}
} // namespace

namespace SendGrid {

std::string request_body(SendGridConfig const& config, Outbound const& msg)
{
  json personalization;
  personalization["to"] = json::array({{{"email", msg.to}}});
  if (!msg.correlation_id.empty())
    personalization["custom_args"]["correlation_id"] = msg.correlation_id;

  json from{{"email", config.from_email}};
  if (!config.from_name.empty())
    from["name"] = config.from_name;

  auto const text = msg.text ? *msg.text : Message::html_to_text(msg.content);

  json body;
  body["personalizations"] = json::array({personalization});
  body["from"]             = from;
  body["subject"]          = msg.subject;
  body["content"]          = json::array({
      {{"type", "text/plain"}, {"value", text}},
      {{"type", "text/html"}, {"value", msg.content}},
  });
  body["tracking_settings"]["click_tracking"]["enable"] = true;
  body["tracking_settings"]["open_tracking"]["enable"]  = true;
  if (msg.campaign_id)
    body["categories"] = json::array({*msg.campaign_id});

  // Text from imported lists is not always UTF-8; send U+FFFD rather
  // than fail the message.
  return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string error_message(std::string const& body)
{
  auto const j = json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.contains("errors") && j["errors"].is_array()
      && !j["errors"].empty() && j["errors"][0].contains("message")
      && j["errors"][0]["message"].is_string()) {
    return j["errors"][0]["message"].get<std::string>();
  }
  return body;
}

CurlClient::CurlClient()
{
  std::call_once(curl_init, [] {
    CHECK_EQ(curl_global_init(CURL_GLOBAL_DEFAULT), CURLE_OK);
  });

  auto const env = getenv("DELIVERD_SENDGRID_ENDPOINT");
  endpoint_      = env ? env : FLAGS_sendgrid_endpoint;
}

std::string CurlClient::send(SendGridConfig const& config, Outbound const& msg)
{
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl{curl_easy_init(),
                                                           curl_easy_cleanup};
  if (!curl)
    throw SendError("curl_easy_init failed");

  curl_slist* raw_headers = nullptr;
  raw_headers             = curl_slist_append(
      raw_headers, fmt::format("Authorization: Bearer {}", config.api_key).c_str());
  raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers{
      raw_headers, curl_slist_free_all};

  std::string payload;
  try {
    payload = request_body(config, msg);
  }
  catch (json::exception const& e) {
    throw SendError(fmt::format("SendGrid request not built: {}", e.what()));
  }

  Exchange ex;
  char     errbuf[CURL_ERROR_SIZE]{'\0'};

  auto const c = curl.get();
  curl_easy_setopt(c, CURLOPT_URL, endpoint_.c_str());
  curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(c, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, &ex);
  curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, header_cb);
  curl_easy_setopt(c, CURLOPT_HEADERDATA, &ex);
  curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(
      c, CURLOPT_TIMEOUT_MS,
      static_cast<long>(std::chrono::milliseconds(Config::sendgrid_timeout).count()));

  LOG(INFO) << "POST " << endpoint_ << " to " << msg.to;

  if (auto const rc = curl_easy_perform(c); rc != CURLE_OK) {
    throw SendError(fmt::format("SendGrid request failed: {}",
                                errbuf[0] ? errbuf : curl_easy_strerror(rc)));
  }

  long status = 0;
  curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    throw SendError(fmt::format("SendGrid returned {}: {}", status,
                                error_message(ex.body)));
  }

  LOG(INFO) << "SendGrid accepted message " << ex.message_id << " (" << status
            << ")";
  return ex.message_id;
}

} // namespace SendGrid
