#ifndef MESSAGE_DOT_HPP
#define MESSAGE_DOT_HPP

#include "Delivery.hpp"
#include "TenantConfig.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// An RFC 5322 message: header fields in order, then the body.
class Eml {
public:
  void add_hdr(std::string name, std::string value)
  {
    hdrs_.emplace_back(std::move(name), std::move(value));
  }

  void foreach_hdr(std::function<void(std::string const& name,
                                      std::string const& value)> func) const
  {
    for (auto const& [name, value] : hdrs_) {
      func(name, value);
    }
  }

  // First field with this name, case insensitive.
  std::optional<std::string> hdr(std::string_view name) const;

  void               set_body(std::string body) { body_ = std::move(body); }
  std::string const& body() const { return body_; }

  std::string as_string() const;

private:
  std::vector<std::pair<std::string, std::string>> hdrs_;
  std::string                                      body_;

  friend std::ostream& operator<<(std::ostream& os, Eml const& eml)
  {
    for (auto const& [name, value] : eml.hdrs_) {
      os << name << ": " << value << "\r\n";
    }
    return os << "\r\n" << eml.body_;
  }
};

namespace Message {

// "user@Example.COM" to "example.com"; empty without an '@'.
std::string domain_of(std::string_view address);

// "<{epoch-ms}.{pill}@{domain}>"
std::string make_message_id(std::string_view from_email);

// An RFC 2047 "B" encoded-word sequence when the text is not plain
// printable ASCII, otherwise the text unchanged.
std::string encode_word(std::string_view text);

// Display name and address for From: and the like.
std::string address_hdr(std::string_view name, std::string_view address);

// Rough plain text rendering of an HTML part.
std::string html_to_text(std::string_view html);

// Everything but the DKIM-Signature.
Eml compose(SmtpConfig const& config, Outbound const& msg);

// Adds the DKIM-Signature field; throws SendError.
void sign(Eml& eml, DkimConfig const& dkim);

} // namespace Message

#endif // MESSAGE_DOT_HPP
