#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <string>

#include "SockBuffer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  Sock(int                       fd_in,
       int                       fd_out,
       std::chrono::milliseconds read_timeout  = Config::default_read_timeout,
       std::chrono::milliseconds write_timeout = Config::default_write_timeout,
       std::chrono::milliseconds starttls_timeout
       = Config::default_starttls_timeout);

  char const* us_c_str() const { return us_addr_str_; }
  char const* them_c_str() const { return them_addr_str_; }
  bool        has_peername() const { return them_addr_str_[0] != '\0'; }

  bool input_ready(std::chrono::milliseconds wait)
  {
    return iostream_->input_ready(wait);
  }
  bool timed_out() { return iostream_->timed_out(); }

  void set_read_timeout(std::chrono::milliseconds t)
  {
    iostream_->set_read_timeout(t);
  }

  std::istream& in() { return iostream_; }
  std::ostream& out() { return iostream_; }

  bool starttls_client(char const* server_name)
  {
    return iostream_->starttls_client(server_name);
  }
  bool        tls() { return iostream_->tls(); }
  std::string tls_info() { return iostream_->tls_info(); }

  void log_totals() { return iostream_->log_totals(); }

private:
  boost::iostreams::stream<SockBuffer> iostream_;

  socklen_t us_addr_len_{sizeof us_addr_};
  socklen_t them_addr_len_{sizeof them_addr_};

  sockaddr_storage us_addr_{};
  sockaddr_storage them_addr_{};

  char us_addr_str_[INET6_ADDRSTRLEN]{'\0'};
  char them_addr_str_[INET6_ADDRSTRLEN]{'\0'};
};

#endif // SOCK_DOT_HPP
