#ifndef DKIM_DOT_HPP
#define DKIM_DOT_HPP

#include "TenantConfig.hpp"

#include <string>
#include <string_view>

struct dkim_lib;
struct dkim;

namespace Config {
// clang-format off
constexpr char const* dkim_signed_headers[]{
    "from",
    "to",
    "subject",
    "date",
    "message-id",
    nullptr,
};
// clang-format on
} // namespace Config

namespace DKIM {

// One signature over one message, relaxed/relaxed, rsa-sha256.
class Signer {
  Signer(Signer const&) = delete;
  Signer& operator=(Signer const&) = delete;

public:
  // Throws ConfigurationError if libopendkim rejects the parameters.
  Signer(std::string const& private_key,
         std::string const& selector,
         std::string const& domain);
  ~Signer();

  // These throw SendError.
  void header(std::string_view header);
  void eoh();
  void body(std::string_view body);
  void eom();

  // Value of the DKIM-Signature header, folded.
  std::string getsighdr();

private:
  dkim_lib* lib_{nullptr};
  dkim*     dkim_{nullptr};
  int       status_{0};
};

// Throws ConfigurationError unless the PEM key loads as an RSA private
// key and a trial signature succeeds.
void check_key(DkimConfig const& config);

// Sign a complete CRLF-terminated message, returning the
// "DKIM-Signature: ..." header line (without trailing CRLF).
std::string sign_message(DkimConfig const& config, std::string_view message);

} // namespace DKIM

#endif // DKIM_DOT_HPP
