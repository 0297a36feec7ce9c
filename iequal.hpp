#ifndef IEQUAL_DOT_HPP
#define IEQUAL_DOT_HPP

#include <algorithm>
#include <cctype>
#include <string_view>

// ASCII case folding for protocol keywords, header names and DNS tags.

inline char fold_char(char c)
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool iequal(std::string_view a, std::string_view b)
{
  return a.size() == b.size()
         && std::equal(a.begin(), a.end(), b.begin(),
                       [](char x, char y) { return fold_char(x) == fold_char(y); });
}

inline bool istarts_with(std::string_view str, std::string_view prefix)
{
  return str.size() >= prefix.size() && iequal(str.substr(0, prefix.size()), prefix);
}

#endif // IEQUAL_DOT_HPP
