#include "Message.hpp"

#include "Base64.hpp"
#include "DKIM-keygen.hpp"

#include <sstream>

#include <glog/logging.h>

namespace {
SmtpConfig sender()
{
  SmtpConfig config;
  config.host       = "smtp.example.com";
  config.port       = 587;
  config.username   = "mailer";
  config.password   = "secret";
  config.from_email = "News@Example.COM";
  config.from_name  = "Example News";
  return config;
}

void check_helpers()
{
  CHECK_EQ(Message::domain_of("user@Example.COM"), "example.com");
  CHECK_EQ(Message::domain_of("no-at-sign"), "");

  auto const id = Message::make_message_id("news@example.com");
  CHECK_EQ(id.front(), '<');
  CHECK_EQ(id.back(), '>');
  CHECK_NE(id.find("@example.com>"), std::string::npos);
  CHECK_NE(id, Message::make_message_id("news@example.com"));

  CHECK_EQ(Message::encode_word("Plain subject"), "Plain subject");
  auto const word = Message::encode_word("Caf\xC3\xA9 news");
  CHECK_EQ(word, "=?UTF-8?B?" + Base64::enc("Caf\xC3\xA9 news") + "?=");

  // Long text splits into several words, never inside a character.
  std::string long_text;
  for (auto i = 0; i < 40; ++i)
    long_text += "\xC3\xA9";
  auto const words = Message::encode_word(long_text);
  CHECK_NE(words.find("\r\n "), std::string::npos);
  std::istringstream is{words};
  std::string        decoded, w;
  while (is >> w) {
    CHECK_EQ(w.find("=?UTF-8?B?"), 0u);
    CHECK_LE(w.size(), 75u);
    decoded += Base64::dec(w.substr(10, w.size() - 12));
  }
  CHECK_EQ(decoded, long_text);

  CHECK_EQ(Message::address_hdr("", "a@example.com"), "a@example.com");
  CHECK_EQ(Message::address_hdr("Ann \"A\" Lee", "a@example.com"),
           "\"Ann \\\"A\\\" Lee\" <a@example.com>");

  CHECK_EQ(Message::html_to_text("<h1>Hi &amp; welcome</h1>"
                                 "<style>p { color: red }</style>"
                                 "<p>  First   </p><p>Second<br>Third</p>"),
           "Hi & welcome\nFirst\nSecond\nThird\n");
}

void check_compose()
{
  auto const config = sender();

  Outbound msg;
  msg.to             = "reader@example.net";
  msg.subject        = "Spring sale";
  msg.content        = "<p>Hello</p>";
  msg.correlation_id = "email-1";

  auto const eml = Message::compose(config, msg);

  CHECK_EQ(eml.hdr("From").value(), "\"Example News\" <News@Example.COM>");
  CHECK_EQ(eml.hdr("to").value(), "reader@example.net");
  CHECK_EQ(eml.hdr("Reply-To").value(), "News@Example.COM");
  CHECK_EQ(eml.hdr("Subject").value(), "Spring sale");
  CHECK_EQ(eml.hdr("MIME-Version").value(), "1.0");
  CHECK_EQ(eml.hdr("X-Mailer").value(), "deliverd");
  CHECK_EQ(eml.hdr("List-Unsubscribe").value(),
           "<mailto:unsubscribe@example.com>");
  CHECK_EQ(eml.hdr("X-Campaign-ID").value(), "direct");
  CHECK_EQ(eml.hdr("X-Sender-IP").value(), "dynamic");
  CHECK_EQ(eml.hdr("Precedence").value(), "bulk");
  CHECK(eml.hdr("Date"));
  CHECK(!eml.hdr("DKIM-Signature"));

  auto const id = eml.hdr("Message-ID").value();
  CHECK_NE(id.find("@example.com>"), std::string::npos);

  auto const type = eml.hdr("Content-Type").value();
  auto const b    = type.find("boundary=\"");
  CHECK_NE(b, std::string::npos);
  auto const boundary
      = type.substr(b + 10, type.size() - (b + 10) - 1); // drop the quote
  auto const& body = eml.body();
  CHECK_EQ(body.find("--" + boundary + "\r\n"), 0u);
  CHECK_NE(body.find("Content-Type: text/plain; charset=utf-8\r\n"
                     "Content-Transfer-Encoding: 7bit\r\n\r\nHello\r\n"),
           std::string::npos);
  CHECK_NE(body.find("<p>Hello</p>\r\n"), std::string::npos);
  CHECK_EQ(body.substr(body.size() - boundary.size() - 6),
           "--" + boundary + "--\r\n");

  auto const text = eml.as_string();
  CHECK_EQ(text.find("Message-ID: <"), 0u);
  CHECK_NE(text.find("\r\n\r\n--" + boundary), std::string::npos);

  // Campaign, static address, explicit text and 8bit content.
  auto with = sender();
  with.static_ip = "192.0.2.10";
  with.reply_to  = "replies@example.com";
  msg.campaign_id = "spring-2026";
  msg.text        = "Hello, plain";
  msg.subject     = "\xC3\x9C" "ber";
  msg.content     = "<p>\xC3\x9C" "ber</p>";

  auto const eml2 = Message::compose(with, msg);
  CHECK_EQ(eml2.hdr("X-Campaign-ID").value(), "spring-2026");
  CHECK_EQ(eml2.hdr("X-Sender-IP").value(), "192.0.2.10");
  CHECK_EQ(eml2.hdr("Reply-To").value(), "replies@example.com");
  CHECK_EQ(eml2.hdr("Subject").value().find("=?UTF-8?B?"), 0u);
  CHECK_NE(eml2.body().find("Hello, plain\r\n"), std::string::npos);
  CHECK_NE(eml2.body().find("Content-Transfer-Encoding: base64"),
           std::string::npos);
  CHECK_NE(eml2.hdr("Message-ID").value(), id);
}

void check_sign()
{
  auto const kp = DKIM::generate_key_pair("example.com", 1024);

  Outbound msg;
  msg.to      = "reader@example.net";
  msg.subject = "Signed";
  msg.content = "<p>Signed</p>";

  auto eml = Message::compose(sender(), msg);
  Message::sign(eml, DkimConfig{true, kp.private_key, kp.selector,
                                "example.com"});

  auto const sig = eml.hdr("DKIM-Signature");
  CHECK(sig);
  CHECK_NE(sig->find("d=example.com"), std::string::npos);
  CHECK_NE(sig->find("s=" + kp.selector), std::string::npos);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_helpers();
  check_compose();
  check_sign();
}
