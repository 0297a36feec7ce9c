#include "SendGrid.hpp"

#include <glog/logging.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  SendGridConfig config;
  config.api_key    = "SG.key";
  config.from_email = "news@example.com";
  config.from_name  = "Example News";

  Outbound msg;
  msg.to             = "reader@example.net";
  msg.subject        = "Spring sale";
  msg.content        = "<p>Hello &amp; welcome</p>";
  msg.correlation_id = "email-3";
  msg.campaign_id    = "spring-2026";

  auto const body = json::parse(SendGrid::request_body(config, msg));

  CHECK_EQ(body["from"]["email"], "news@example.com");
  CHECK_EQ(body["from"]["name"], "Example News");
  CHECK_EQ(body["subject"], "Spring sale");

  auto const& p = body["personalizations"];
  CHECK_EQ(p.size(), 1u);
  CHECK_EQ(p[0]["to"][0]["email"], "reader@example.net");
  CHECK_EQ(p[0]["custom_args"]["correlation_id"], "email-3");

  auto const& content = body["content"];
  CHECK_EQ(content.size(), 2u);
  CHECK_EQ(content[0]["type"], "text/plain");
  CHECK_EQ(content[0]["value"], "Hello & welcome\n");
  CHECK_EQ(content[1]["type"], "text/html");
  CHECK_EQ(content[1]["value"], msg.content);

  CHECK(body["tracking_settings"]["click_tracking"]["enable"].get<bool>());
  CHECK(body["tracking_settings"]["open_tracking"]["enable"].get<bool>());
  CHECK_EQ(body["categories"][0], "spring-2026");

  // No name, no campaign, no correlation id, explicit text.
  config.from_name = "";
  msg.campaign_id.reset();
  msg.correlation_id = "";
  msg.text           = "plain words";
  auto const bare    = json::parse(SendGrid::request_body(config, msg));
  CHECK(!bare["from"].contains("name"));
  CHECK(!bare.contains("categories"));
  CHECK(!bare["personalizations"][0].contains("custom_args"));
  CHECK_EQ(bare["content"][0]["value"], "plain words");

  // Latin-1 from an imported list still makes a request.
  msg.subject         = "Caf\xe9 offer";
  msg.text            = "Cr\xe8me br\xfbl\xe9" "e";
  auto const latin1   = SendGrid::request_body(config, msg);
  CHECK(json::accept(latin1));
  auto const repaired = json::parse(latin1);
  CHECK_EQ(repaired["subject"], "Caf\xEF\xBF\xBD offer");
  CHECK_EQ(repaired["content"][0]["value"].get<std::string>().find("Cr"), 0u);

  CHECK_EQ(SendGrid::error_message(
               R"({"errors":[{"message":"The provided authorization grant is )"
               R"(invalid, expired, or revoked","field":null}]})"),
           "The provided authorization grant is invalid, expired, or revoked");
  CHECK_EQ(SendGrid::error_message("Bad Gateway"), "Bad Gateway");
  CHECK_EQ(SendGrid::error_message(R"({"errors":[]})"), R"({"errors":[]})");
}
