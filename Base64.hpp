#ifndef BASE64_DOT_HPP
#define BASE64_DOT_HPP

#include <string>
#include <string_view>

namespace Base64 {
// RFC 4648 alphabet, padded; wrap > 0 inserts CRLF every wrap chars.
std::string enc(std::string_view in, std::string::size_type wrap = 0);

// Ignores CR and LF; throws std::invalid_argument on anything else
// outside the alphabet.
std::string dec(std::string_view in);
} // namespace Base64

#endif // BASE64_DOT_HPP
