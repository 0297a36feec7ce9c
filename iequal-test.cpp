#include "iequal.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(iequal("", ""));
  CHECK(iequal("v=spf1", "V=SPF1"));
  CHECK(iequal("Message-ID", "message-id"));
  CHECK(!iequal("DKIM-Signature", "DKIM-Signatures"));
  CHECK(!iequal("all", ""));

  CHECK(istarts_with("X-Message-Id: abc", "x-message-id:"));
  CHECK(istarts_with("starttls", "STARTTLS"));
  CHECK(!istarts_with("AUTH", "AUTH PLAIN"));

  // Bytes outside ASCII compare as themselves.
  CHECK(iequal("\xC3\x9C", "\xC3\x9C"));
  CHECK(!iequal("\xC3\x9C", "\xC3\xBC"));
}
