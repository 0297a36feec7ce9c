#include "Base64.hpp"

#include <stdexcept>

#include <openssl/evp.h>

#include <glog/logging.h>

namespace Base64 {

std::string enc(std::string_view in, std::string::size_type wrap)
{
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');

  auto const len = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<unsigned char const*>(in.data()), in.size());
  CHECK_GE(len, 0);
  out.resize(len);

  if (wrap == 0 || out.size() <= wrap)
    return out;

  std::string wrapped;
  wrapped.reserve(out.size() + 2 * (out.size() / wrap));
  for (std::string::size_type pos = 0; pos < out.size(); pos += wrap) {
    if (pos)
      wrapped += "\r\n";
    wrapped.append(out, pos, wrap);
  }
  return wrapped;
}

std::string dec(std::string_view in)
{
  std::string text;
  text.reserve(in.size());
  for (auto ch : in) {
    if (ch == '\r' || ch == '\n')
      continue;
    text += ch;
  }

  if (text.size() % 4)
    throw std::invalid_argument("base64 length not a multiple of four");

  std::string out(3 * (text.size() / 4), '\0');

  auto const len = EVP_DecodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<unsigned char const*>(text.data()), text.size());
  if (len < 0)
    throw std::invalid_argument("bad character in decode");

  // EVP_DecodeBlock counts the padding as zero bytes.
  auto pad = 0;
  if (!text.empty() && text.back() == '=')
    ++pad;
  if (text.size() > 1 && text[text.size() - 2] == '=')
    ++pad;

  out.resize(len - pad);
  return out;
}

} // namespace Base64
