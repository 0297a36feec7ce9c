#include "TLS-OpenSSL.hpp"

#include "POSIX.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  POSIX::set_nonblocking(fds[0]);

  // A peer that answers the ClientHello with plain text.
  PCHECK(write(fds[1], "421 not now\r\n", 13) == 13);

  TLS tls;
  CHECK(!tls.starttls_client(fds[0], fds[0], "relay.test", 1s));
  CHECK(!tls.verified());
  CHECK(tls.verified_peername().empty());

  // A peer that says nothing at all.
  int quiet[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, quiet) == 0);
  POSIX::set_nonblocking(quiet[0]);

  TLS silent;
  CHECK(!silent.starttls_client(quiet[0], quiet[0], "relay.test", 50ms));

  close(fds[0]);
  close(fds[1]);
  close(quiet[0]);
  close(quiet[1]);
}
