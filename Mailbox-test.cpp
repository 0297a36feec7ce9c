#include "Mailbox.hpp"

#include "Errors.hpp"

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<Mailbox> : ostream_formatter {};

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Mailbox mb;
  CHECK(mb.empty());

  Mailbox dg0{"gene@Digilicious.COM"};
  CHECK_EQ(dg0.local_part(), "gene");
  CHECK_EQ(dg0.domain(), "digilicious.com");
  CHECK_EQ(static_cast<std::string>(dg0), "gene@digilicious.com");
  CHECK_EQ(fmt::format("{}", dg0), "gene@digilicious.com");

  auto threw = false;
  try {
    Mailbox bad("should throw@example.com");
  }
  catch (ValidationError const& e) {
    threw = true;
  }
  CHECK(threw);

  std::string msg;
  CHECK(Mailbox::validate("simple@example.com", msg));
  CHECK(Mailbox::validate("very.common@example.com", msg));
  CHECK(Mailbox::validate("disposable.style.email.with+symbol@example.com",
                          msg));
  CHECK(Mailbox::validate("other.email-with-hyphen@example.com", msg));
  CHECK(Mailbox::validate("user.name+tag+sorting@example.com", msg));
  CHECK(Mailbox::validate("x@example.com", msg));
  CHECK(Mailbox::validate("example-indeed@strange-example.com", msg));
  CHECK(Mailbox::validate("example@s.example", msg));

  // (space between the quotes)
  CHECK(Mailbox::validate("\" \"@example.org", msg));

  // (quoted double dot)
  CHECK(Mailbox::validate("\"john..doe\"@example.org", msg));

  CHECK(Mailbox::validate("mailhost!username@example.org", msg));
  CHECK(Mailbox::validate("user%example.com@example.org", msg));

  CHECK(Mailbox::validate("실례@실례.테스트", msg));

  // Invalid email addresses

  CHECK(!Mailbox::validate("", msg));
  CHECK_EQ(msg, "empty address"s);

  CHECK(!Mailbox::validate("Abc.example.com", msg)); // (no @ character)
  CHECK_EQ(msg, "invalid mailbox syntax «Abc.example.com»"s);

  CHECK(!Mailbox::validate("A@b@c@example.com", msg));
  CHECK_EQ(msg, "invalid mailbox syntax «A@b@c@example.com»"s);

  CHECK(!Mailbox::validate("a\"b(c)d,e:f;g<h>i[j\\k]l@example.com", msg));

  CHECK(!Mailbox::validate("just\"not\"right@example.com", msg));
  CHECK(!Mailbox::validate("this is\"not\\allowed@example.com", msg));

  // Not fully qualified, and no address literals.
  CHECK(!Mailbox::validate("foo@bar", msg));
  CHECK_EQ(msg, "invalid mailbox syntax «foo@bar»"s);
  CHECK(!Mailbox::validate("gene@[127.0.0.1]", msg));
  CHECK(!Mailbox::validate("allen@bad_d0main.com", msg));
  CHECK(!Mailbox::validate("foo@.example.com", msg));
  CHECK(!Mailbox::validate("foo@example.com.", msg));
  CHECK(!Mailbox::validate("2962", msg));

  // Label longer than 63 octets.
  CHECK(!Mailbox::validate(
      "foo@1234567890123456789012345678901234567890123456789012345678901234."
      "com",
      msg));
  CHECK_EQ(
      msg,
      "domain label «1234567890123456789012345678901234567890123456789012345678901234» too long"s);

  // Total domain length too long.
  CHECK(!Mailbox::validate(
      "foo@"
      "123456789012345678901234567890123456789012345678901234567890123."
      "123456789012345678901234567890123456789012345678901234567890123."
      "123456789012345678901234567890123456789012345678901234567890123."
      "123456789012345678901234567890123456789012345678901234567890123."
      "com",
      msg));
  CHECK_EQ(msg,
           "domain name «"
           "123456789012345678901234567890123456789012345678901234567890123."
           "123456789012345678901234567890123456789012345678901234567890123."
           "123456789012345678901234567890123456789012345678901234567890123."
           "123456789012345678901234567890123456789012345678901234567890123."
           "com» too long"s);

  CHECK(!Mailbox::validate(
      "12345678901234567890123456789012345678901234567890123456789012345"
      "@example.com",
      msg));
}
