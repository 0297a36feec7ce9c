#ifndef DKIM_KEYGEN_DOT_HPP
#define DKIM_KEYGEN_DOT_HPP

#include <string>

namespace Config {
constexpr int dkim_key_bits{2048};
} // namespace Config

namespace DKIM {

struct Key_pair {
  std::string private_key; // PEM, PKCS #8
  std::string public_key;  // base64 SubjectPublicKeyInfo, no PEM framing
  std::string selector;    // "sel" + epoch milliseconds, unique per process

  // "{selector}._domainkey.{domain}" TXT "v=DKIM1; k=rsa; p=..."
  std::string dns_name;
  std::string dns_value;
};

// Throws std::runtime_error if OpenSSL can't make a key.
Key_pair generate_key_pair(std::string const& domain,
                           int                bits = Config::dkim_key_bits);

std::string make_selector();

} // namespace DKIM

#endif // DKIM_KEYGEN_DOT_HPP
