#include "Pill.hpp"

#include <random>

#include <boost/algorithm/string/case_conv.hpp>

#include <cppcodec/base32_crockford.hpp>

Pill::Pill()
{
  std::random_device                            rd;
  std::uniform_int_distribution<decltype(s_)> uni_dist;
  s_ = uni_dist(rd);

  unsigned char bytes[sizeof(s_)];
  for (auto i = 0u; i < sizeof(s_); ++i)
    bytes[i] = static_cast<unsigned char>(s_ >> (8 * i));

  str_ = boost::algorithm::to_lower_copy(
      cppcodec::base32_crockford::encode(bytes, sizeof(bytes)));
}
