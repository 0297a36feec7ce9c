#include "POSIX.hpp"

#include <cerrno>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  POSIX::set_nonblocking(fds[0]);
  POSIX::set_nonblocking(fds[0]); // twice is fine

  CHECK(!POSIX::input_ready(fds[0], 1ms));
  CHECK(POSIX::output_ready(fds[0], 1ms));

  auto t_o = false;
  char buf[16];
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 10ms, t_o), -1);
  CHECK(t_o);

  t_o = false;
  CHECK_EQ(POSIX::write(fds[1], "EHLO\r\n", 6, 1s, t_o), 6);
  CHECK(!t_o);
  CHECK(POSIX::input_ready(fds[0], 1s));
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 1s, t_o), 6);
  CHECK_EQ(std::string(buf, 6), "EHLO\r\n");

  // End of file reads as zero octets.
  close(fds[1]);
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 1s, t_o), 0);
  CHECK(!t_o);
  close(fds[0]);
}
