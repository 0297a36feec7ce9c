#include "Base64.hpp"

#include <stdexcept>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // RFC 4648 section 10
  CHECK_EQ(Base64::enc(""), "");
  CHECK_EQ(Base64::enc("f"), "Zg==");
  CHECK_EQ(Base64::enc("fo"), "Zm8=");
  CHECK_EQ(Base64::enc("foo"), "Zm9v");
  CHECK_EQ(Base64::enc("foob"), "Zm9vYg==");
  CHECK_EQ(Base64::enc("fooba"), "Zm9vYmE=");
  CHECK_EQ(Base64::enc("foobar"), "Zm9vYmFy");

  CHECK_EQ(Base64::dec("Zg=="), "f");
  CHECK_EQ(Base64::dec("Zm8="), "fo");
  CHECK_EQ(Base64::dec("Zm9vYmFy"), "foobar");

  // SMTP AUTH PLAIN initial response
  std::string const plain{"\0user\0secret", 12};
  CHECK_EQ(Base64::enc(plain), "AHVzZXIAc2VjcmV0");
  CHECK_EQ(Base64::dec("AHVzZXIAc2VjcmV0"), plain);

  // MIME body parts wrap at 76
  std::string const html(200, 'x');
  auto const wrapped = Base64::enc(html, 76);
  CHECK_EQ(wrapped.find("\r\n"), 76u);
  CHECK_EQ(wrapped.substr(78, 76).find("\r\n"), std::string::npos);
  CHECK_EQ(Base64::dec(wrapped), html);
  CHECK_EQ(Base64::enc("short", 76).find('\r'), std::string::npos);

  auto bad = false;
  try {
    Base64::dec("Zm9v!mFy");
  }
  catch (std::invalid_argument const&) {
    bad = true;
  }
  CHECK(bad);

  bad = false;
  try {
    Base64::dec("Zm9");
  }
  catch (std::invalid_argument const&) {
    bad = true;
  }
  CHECK(bad);
}
