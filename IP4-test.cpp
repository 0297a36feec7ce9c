#include "IP4.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using IP4::is_address;
  using IP4::is_dnsbl_refusal;
  using IP4::is_loopback_net;
  using IP4::reverse;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("127.0.0.2"));
  CHECK(is_address("255.255.255.255"));
  CHECK(is_address("01.01.01.01"));

  CHECK(!is_address(""));
  CHECK(!is_address("example.com"));
  CHECK(!is_address("1.2.3"));
  CHECK(!is_address("1.2.3.4."));
  CHECK(!is_address("1.2.3.256"));
  CHECK(!is_address("0001.0.0.0"));
  CHECK(!is_address("[1.2.3.4]"));

  CHECK_EQ(reverse("1.2.3.4"), "4.3.2.1");
  CHECK_EQ(reverse("192.0.2.99"), "99.2.0.192");

  // What DNSBL zones answer with.
  CHECK(is_loopback_net("127.0.0.2"));
  CHECK(is_loopback_net("127.0.0.11"));
  CHECK(!is_loopback_net("10.0.0.2"));
  CHECK(!is_loopback_net("not an address"));

  CHECK(is_dnsbl_refusal("127.255.255.254"));
  CHECK(is_dnsbl_refusal("127.255.255.252"));
  CHECK(!is_dnsbl_refusal("127.0.0.2"));
  CHECK(!is_dnsbl_refusal("128.255.255.254"));
}
