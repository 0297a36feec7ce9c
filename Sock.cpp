#include "Sock.hpp"

#include <cerrno>

#include <glog/logging.h>

namespace {
// Fills str from addr, leaving it empty for anything but IPv4 and IPv6.
void addr_str(sockaddr_storage const& addr, char* str, size_t len)
{
  switch (addr.ss_family) {
  case AF_INET: {
    auto const in4 = reinterpret_cast<sockaddr_in const*>(&addr);
    PCHECK(inet_ntop(AF_INET, &in4->sin_addr, str, len) != nullptr);
    break;
  }
  case AF_INET6: {
    auto const in6 = reinterpret_cast<sockaddr_in6 const*>(&addr);
    PCHECK(inet_ntop(AF_INET6, &in6->sin6_addr, str, len) != nullptr);
    break;
  }
  default: str[0] = '\0'; break;
  }
}
} // namespace

Sock::Sock(int                       fd_in,
           int                       fd_out,
           std::chrono::milliseconds read_timeout,
           std::chrono::milliseconds write_timeout,
           std::chrono::milliseconds starttls_timeout)
  : iostream_(fd_in, fd_out, read_timeout, write_timeout, starttls_timeout)
{
  // Get our local IP address as "us".

  auto const us = reinterpret_cast<sockaddr*>(&us_addr_);
  if (-1 == getsockname(fd_in, us, &us_addr_len_)) {
    // Ignore ENOTSOCK errors from getsockname, useful for testing.
    PLOG_IF(WARNING, ENOTSOCK != errno) << "getsockname failed";
  }
  else {
    addr_str(us_addr_, us_addr_str_, sizeof us_addr_str_);
  }

  // Get the remote IP address as "them".

  auto const them = reinterpret_cast<sockaddr*>(&them_addr_);
  if (-1 == getpeername(fd_out, them, &them_addr_len_)) {
    PLOG_IF(WARNING, ENOTSOCK != errno) << "getpeername failed";
  }
  else {
    addr_str(them_addr_, them_addr_str_, sizeof them_addr_str_);
  }
}
