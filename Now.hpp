#ifndef NOW_DOT_HPP
#define NOW_DOT_HPP

#include <chrono>
#include <ctime>
#include <ostream>

#include <glog/logging.h>

// One instant, with its RFC 5322 section 3.3 date-time rendering in
// the local zone.
class Now {
public:
  Now()
    : v_{std::chrono::system_clock::now()}
  {
    auto const t = std::chrono::system_clock::to_time_t(v_);
    tm         tm_buf{};
    CHECK_NOTNULL(localtime_r(&t, &tm_buf));
    CHECK_EQ(strftime(c_str_, sizeof c_str_, "%a, %d %b %Y %H:%M:%S %z",
                      &tm_buf),
             sizeof(c_str_) - 1);
  }

  std::chrono::system_clock::time_point point() const { return v_; }

  long long ms() const
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               v_.time_since_epoch())
        .count();
  }

  char const* c_str() const { return c_str_; }

  bool operator==(Now const& that) const { return v_ == that.v_; }
  bool operator!=(Now const& that) const { return !(*this == that); }

private:
  std::chrono::system_clock::time_point v_;
  char                                  c_str_[32];

  friend std::ostream& operator<<(std::ostream& s, Now const& now)
  {
    return s << now.c_str_;
  }
};

#endif // NOW_DOT_HPP
