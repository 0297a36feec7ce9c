#include "Message.hpp"

#include "Base64.hpp"
#include "DKIM.hpp"
#include "Now.hpp"
#include "Pill.hpp"
#include "iequal.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>

DEFINE_string(mailer_name, "deliverd", "X-Mailer header value");

namespace {
// RFC 5322 section 2.1.1, lines "MUST be no more than 998 characters"
constexpr std::string_view::size_type max_line_length{998};

// RFC 2047 encoded-words are at most 75 chars; 45 octets of text
// become 60 of base64, plus 12 for "=?UTF-8?B?" and "?=".
constexpr std::string_view::size_type encoded_word_octets{45};

constexpr std::string::size_type base64_line_length{76};

bool is_printable(std::string_view s)
{
  return std::all_of(begin(s), end(s), [](unsigned char ch) {
    return ch == '\t' || (ch >= ' ' && ch <= '~');
  });
}

bool is_7bit(std::string_view s)
{
  std::string_view::size_type line = 0;
  for (unsigned char ch : s) {
    if (ch > 127 || ch == '\0')
      return false;
    if (ch == '\n') {
      line = 0;
      continue;
    }
    if (++line > max_line_length)
      return false;
  }
  return true;
}

bool is_continuation(unsigned char ch) { return (ch & 0xC0) == 0x80; }

std::string mailer_name()
{
  if (auto const env = getenv("DELIVERD_MAILER_NAME"); env != nullptr)
    return env;
  return FLAGS_mailer_name;
}

// Every line ending becomes CRLF, and the text ends with one.
std::string crlf(std::string_view s)
{
  std::string out;
  out.reserve(s.size() + s.size() / 40);
  for (std::string_view::size_type i = 0; i < s.size(); ++i) {
    auto const ch = s[i];
    if (ch == '\r') {
      if (i + 1 < s.size() && s[i + 1] == '\n')
        ++i;
      out += "\r\n";
    }
    else if (ch == '\n') {
      out += "\r\n";
    }
    else {
      out += ch;
    }
  }
  if (out.size() < 2 || out.compare(out.size() - 2, 2, "\r\n") != 0)
    out += "\r\n";
  return out;
}

std::string part(char const* type, std::string_view content)
{
  if (is_7bit(content)) {
    return fmt::format("Content-Type: {}; charset=utf-8\r\n"
                       "Content-Transfer-Encoding: 7bit\r\n"
                       "\r\n"
                       "{}",
                       type, crlf(content));
  }
  return fmt::format("Content-Type: {}; charset=utf-8\r\n"
                     "Content-Transfer-Encoding: base64\r\n"
                     "\r\n"
                     "{}\r\n",
                     type, Base64::enc(content, base64_line_length));
}

// Tag name following '<', lower case, with any leading '/'.
std::string tag_name(std::string_view tag)
{
  std::string name;
  for (auto ch : tag) {
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '>')
      break;
    if (ch == '/' && !name.empty())
      break;
    name += ch;
  }
  boost::to_lower(name);
  return name;
}

bool breaks_line(std::string const& tag)
{
  for (auto br : {"br", "/p", "/div", "/li", "/tr", "/h1", "/h2", "/h3",
                  "/h4", "/h5", "/h6", "/title"}) {
    if (tag == br)
      return true;
  }
  return false;
}
} // namespace

std::optional<std::string> Eml::hdr(std::string_view name) const
{
  for (auto const& [n, value] : hdrs_) {
    if (iequal(n, name))
      return value;
  }
  return {};
}

std::string Eml::as_string() const
{
  std::ostringstream os;
  os << *this;
  return os.str();
}

namespace Message {

std::string domain_of(std::string_view address)
{
  auto const at = address.rfind('@');
  if (at == std::string_view::npos)
    return {};
  std::string domain{address.substr(at + 1)};
  boost::to_lower(domain);
  return domain;
}

std::string make_message_id(std::string_view from_email)
{
  auto const now  = Now{};
  auto const pill = Pill{};
  return fmt::format("<{}.{}@{}>", now.ms(), pill.as_string_view(),
                     domain_of(from_email));
}

std::string encode_word(std::string_view text)
{
  if (is_printable(text))
    return std::string{text};

  std::string out;
  while (!text.empty()) {
    auto len = std::min(text.size(), encoded_word_octets);
    // Never split a UTF-8 sequence between two words.
    while (len < text.size() && len > 0
           && is_continuation(static_cast<unsigned char>(text[len])))
      --len;
    if (len == 0)
      len = std::min(text.size(), encoded_word_octets);

    if (!out.empty())
      out += "\r\n ";
    out += fmt::format("=?UTF-8?B?{}?=", Base64::enc(text.substr(0, len)));
    text.remove_prefix(len);
  }
  return out;
}

std::string address_hdr(std::string_view name, std::string_view address)
{
  if (name.empty())
    return std::string{address};

  if (!is_printable(name))
    return fmt::format("{} <{}>", encode_word(name), address);

  std::string quoted;
  for (auto ch : name) {
    if (ch == '"' || ch == '\\')
      quoted += '\\';
    quoted += ch;
  }
  return fmt::format("\"{}\" <{}>", quoted, address);
}

std::string html_to_text(std::string_view html)
{
  std::string text;
  std::string skip_until; // closing tag of <style> or <script>

  std::string_view::size_type pos = 0;
  while (pos < html.size()) {
    auto const ch = html[pos];
    if (ch == '<') {
      auto const close = html.find('>', pos);
      if (close == std::string_view::npos)
        break;
      auto const tag = tag_name(html.substr(pos + 1, close - pos - 1));
      pos            = close + 1;

      if (!skip_until.empty()) {
        if (tag == skip_until)
          skip_until.clear();
        continue;
      }
      if (tag == "style" || tag == "script")
        skip_until = "/" + tag;
      else if (breaks_line(tag))
        text += '\n';
      continue;
    }
    if (!skip_until.empty()) {
      ++pos;
      continue;
    }
    if (ch == '&') {
      auto const semi = html.find(';', pos);
      if (semi != std::string_view::npos && semi - pos <= 6) {
        auto const entity = html.substr(pos, semi - pos + 1);
        // clang-format off
        char const* repl = entity == "&amp;"  ? "&"
                         : entity == "&lt;"   ? "<"
                         : entity == "&gt;"   ? ">"
                         : entity == "&quot;" ? "\""
                         : entity == "&#39;"  ? "'"
                         : entity == "&nbsp;" ? " "
                         : nullptr;
        // clang-format on
        if (repl) {
          text += repl;
          pos = semi + 1;
          continue;
        }
      }
    }
    if (ch != '\r')
      text += ch;
    ++pos;
  }

  // Trim each line and drop runs of blank lines.
  std::string out;
  std::istringstream lines{text};
  std::string        line;
  auto               blank = true;
  while (std::getline(lines, line)) {
    auto const first = line.find_first_not_of(" \t");
    if (first == std::string::npos) {
      if (!blank)
        out += '\n';
      blank = true;
      continue;
    }
    auto const last = line.find_last_not_of(" \t");
    out += line.substr(first, last - first + 1);
    out += '\n';
    blank = false;
  }
  return out;
}

Eml compose(SmtpConfig const& config, Outbound const& msg)
{
  auto       eml{Eml{}};
  auto const date{Now{}};
  auto const from_domain = domain_of(config.from_email);

  eml.add_hdr("Message-ID", make_message_id(config.from_email));
  eml.add_hdr("Date", date.c_str());
  eml.add_hdr("From", address_hdr(config.from_name, config.from_email));
  eml.add_hdr("To", msg.to);
  eml.add_hdr("Reply-To", config.reply_to.value_or(config.from_email));
  eml.add_hdr("Subject", encode_word(msg.subject));
  eml.add_hdr("MIME-Version", "1.0");
  eml.add_hdr("X-Mailer", mailer_name());
  eml.add_hdr("List-Unsubscribe",
              fmt::format("<mailto:unsubscribe@{}>", from_domain));
  eml.add_hdr("X-Campaign-ID", msg.campaign_id.value_or("direct"));
  eml.add_hdr("X-Sender-IP", config.static_ip.value_or("dynamic"));
  eml.add_hdr("Precedence", "bulk");

  auto const pill{Pill{}};
  auto const boundary = fmt::format("=_deliverd_{}", pill.as_string_view());
  eml.add_hdr("Content-Type",
              fmt::format("multipart/alternative; boundary=\"{}\"", boundary));

  auto const text = msg.text ? *msg.text : html_to_text(msg.content);

  eml.set_body(fmt::format("--{0}\r\n"
                           "{1}"
                           "--{0}\r\n"
                           "{2}"
                           "--{0}--\r\n",
                           boundary, part("text/plain", text),
                           part("text/html", msg.content)));
  return eml;
}

void sign(Eml& eml, DkimConfig const& dkim)
{
  DKIM::Signer signer(dkim.private_key, dkim.selector, dkim.domain);
  eml.foreach_hdr([&signer](std::string const& name, std::string const& value) {
    signer.header(fmt::format("{}: {}", name, value));
  });
  signer.eoh();
  signer.body(eml.body());
  signer.eom();
  eml.add_hdr("DKIM-Signature", signer.getsighdr());
  LOG(INFO) << "signed " << eml.hdr("Message-ID").value_or("message")
            << " as " << dkim.selector << "._domainkey." << dkim.domain;
}

} // namespace Message
