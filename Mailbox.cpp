#include "Mailbox.hpp"

#include "Errors.hpp"

#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC3629 {
// clang-format off

// 4.  Syntax of UTF-8 Byte Sequences

struct UTF8_tail : range<'\x80', '\xBF'> {};

struct UTF8_2 : seq<range<'\xC2', '\xDF'>, UTF8_tail> {};

struct UTF8_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, UTF8_tail>,
                    seq<range<'\xE1', '\xEC'>, rep<2, UTF8_tail>>,
                    seq<one<'\xED'>, range<'\x80', '\x9F'>, UTF8_tail>,
                    seq<range<'\xEE', '\xEF'>, rep<2, UTF8_tail>>> {};

struct UTF8_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, UTF8_tail>>,
                    seq<range<'\xF1', '\xF3'>, rep<3, UTF8_tail>>,
                    seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, UTF8_tail>>> {};

struct non_ascii : sor<UTF8_2, UTF8_3, UTF8_4> {};

} // namespace RFC3629

namespace RFC5321 {
// <https://tools.ietf.org/html/rfc5321>

using dot = one<'.'>;

// excluded from atext: "(),.@[]"
struct atext : sor<ALPHA, DIGIT,
                   one<'!', '#', '$', '%', '&', '\'', '*', '+', '-', '/',
                       '=', '?', '^', '_', '`', '{', '|', '}', '~'>,
                   RFC3629::non_ascii> {};

struct u_let_dig : sor<ALPHA, DIGIT, RFC3629::non_ascii> {};

struct u_ldh_tail : star<sor<seq<plus<one<'-'>>, u_let_dig>, u_let_dig>> {};

struct sub_domain : seq<u_let_dig, u_ldh_tail> {};

// At least two labels: no dotless hosts, no bare TLDs.
struct domain : seq<sub_domain, plus<dot, sub_domain>> {};

struct qtextSMTP : sor<ranges<32, 33, 35, 91, 93, 126>, RFC3629::non_ascii> {};
struct graphic : range<32, 126> {};
struct quoted_pairSMTP : seq<one<'\\'>, graphic> {};
struct qcontentSMTP : sor<qtextSMTP, quoted_pairSMTP> {};

struct atom : plus<atext> {};
struct dot_string : list<atom, dot> {};
struct quoted_string : seq<one<'"'>, plus<qcontentSMTP>, one<'"'>> {};
struct local_part : sor<dot_string, quoted_string> {};
struct mailbox : seq<local_part, one<'@'>, domain> {};
struct mailbox_only : seq<mailbox, eof> {};

// clang-format on
// Actions

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<local_part> {
  template <typename Input>
  static void apply(Input const& in, Mailbox& addr)
  {
    addr.set_local(in.string());
  }
};

template <>
struct action<domain> {
  template <typename Input>
  static void apply(Input const& in, Mailbox& addr)
  {
    addr.set_domain(in.string());
  }
};
} // namespace RFC5321

void Mailbox::set_domain(std::string_view domain)
{
  domain_ = boost::algorithm::to_lower_copy(std::string(domain));
}

std::string Mailbox::as_string() const
{
  if (empty())
    return "";
  return fmt::format("{}@{}", local_part_, domain_);
}

bool Mailbox::set_(std::string_view mailbox, std::string& msg)
{
  local_part_.clear();
  domain_.clear();

  if (mailbox.empty()) {
    msg = "empty address";
    return false;
  }

  memory_input<> address_in(mailbox.data(), mailbox.size(), "address");
  if (!parse<RFC5321::mailbox_only, RFC5321::action>(address_in, *this)) {
    msg = fmt::format("invalid mailbox syntax «{}»", mailbox);
    return false;
  }

  // RFC-5321 section 4.5.3.1.  Size Limits and Minimums

  if (local_part_.length() > 64) { // Section 4.5.3.1.1.  Local-part
    msg = fmt::format("local part «{}» too long", local_part_);
    return false;
  }
  if (domain_.length() > 255) { // Section 4.5.3.1.2.
    // Also RFC 2181 section 11. Name syntax
    msg = fmt::format("domain name «{}» too long", domain_);
    return false;
  }

  std::vector<std::string> labels;
  boost::algorithm::split(labels, domain_, boost::algorithm::is_any_of("."));
  for (auto const& label : labels) {
    if (label.length() > 63) {
      msg = fmt::format("domain label «{}» too long", label);
      return false;
    }
  }

  return true;
}

Mailbox::Mailbox(std::string_view mailbox)
{
  std::string msg;
  if (!set_(mailbox, msg))
    throw ValidationError(msg);
}

bool Mailbox::validate(std::string_view mailbox, std::string& msg)
{
  Mailbox mbx;
  return mbx.set_(mailbox, msg);
}
