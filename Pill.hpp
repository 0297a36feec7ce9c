#ifndef PILL_DOT_HPP
#define PILL_DOT_HPP

#include <ostream>
#include <string>
#include <string_view>

// A pill is a unit of entropy: 64 random bits in lower case Crockford
// base32, safe in a Message-ID or MIME boundary.

class Pill {
public:
  Pill();

  bool operator==(Pill const& that) const { return this->s_ == that.s_; }
  bool operator!=(Pill const& that) const { return !(*this == that); }

  std::string_view as_string_view() const { return str_; }

private:
  unsigned long long s_;
  std::string        str_;

  friend std::ostream& operator<<(std::ostream& s, Pill const& p)
  {
    return s << p.as_string_view();
  }
};

#endif // PILL_DOT_HPP
