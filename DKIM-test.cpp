#include "DKIM.hpp"

#include "DKIM-keygen.hpp"
#include "Errors.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const kp = DKIM::generate_key_pair("example.com", 1024);

  DkimConfig config{true, kp.private_key, kp.selector, "example.com"};
  DKIM::check_key(config);

  auto const message = "From: News <news@example.com>\r\n"
                       "To: reader@example.net\r\n"
                       "Subject: signed\r\n"
                       "Date: Sat, 17 Oct 2026 10:00:00 +0000\r\n"
                       "Message-ID: <1.abc@example.com>\r\n"
                       "\r\n"
                       "Hello.\r\n";

  auto const sig = DKIM::sign_message(config, message);
  CHECK_EQ(sig.find("DKIM-Signature: "), 0u);
  CHECK_NE(sig.find("d=example.com"), std::string::npos);
  CHECK_NE(sig.find("s=" + kp.selector), std::string::npos);
  CHECK_NE(sig.find("a=rsa-sha256"), std::string::npos);
  CHECK_NE(sig.find("c=relaxed/relaxed"), std::string::npos);
  CHECK_NE(sig.find("bh="), std::string::npos);

  // Same message, same key: same body hash.
  auto const again = DKIM::sign_message(config, message);
  auto const bh    = [](std::string const& s) {
    auto const pos = s.find("bh=");
    return s.substr(pos, s.find(';', pos) - pos);
  };
  CHECK_EQ(bh(sig), bh(again));

  // Field with a continuation line.
  auto const folded = DKIM::sign_message(config, "From: news@example.com\r\n"
                                                 "Subject: a long\r\n"
                                                 " subject\r\n"
                                                 "\r\n"
                                                 "body\r\n");
  CHECK_EQ(folded.find("DKIM-Signature: "), 0u);

  auto threw = false;
  try {
    DKIM::check_key(DkimConfig{true, "not a key", "s", "example.com"});
  }
  catch (ConfigurationError const& e) {
    LOG(INFO) << e.what();
    threw = true;
  }
  CHECK(threw);

  // A signer over a key libopendkim can't load fails cleanly, whether
  // at setup or at the end of the message, and tears down.
  threw = false;
  try {
    DKIM::Signer signer{"not a key", "s", "example.com"};
    signer.header("From: news@example.com");
    signer.eoh();
    signer.body("body\r\n");
    signer.eom();
    signer.getsighdr();
  }
  catch (ConfigurationError const& e) {
    LOG(INFO) << e.what();
    threw = true;
  }
  catch (SendError const& e) {
    LOG(INFO) << e.what();
    threw = true;
  }
  CHECK(threw);
}
