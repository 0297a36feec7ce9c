#include "Sock.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // No addresses to show for a local socket.
  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  {
    Sock sock(fds[0], fds[0]);
    CHECK_EQ(std::string{sock.us_c_str()}, "");
    CHECK(!sock.has_peername());
  }
  close(fds[0]);
  close(fds[1]);

  int listener;
  PCHECK((listener = socket(AF_INET, SOCK_STREAM, 0)) != -1);
  auto addr{sockaddr_in{}};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof addr) == 0);
  PCHECK(listen(listener, 1) == 0);
  socklen_t len = sizeof addr;
  PCHECK(getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

  int fd;
  PCHECK((fd = socket(AF_INET, SOCK_STREAM, 0)) != -1);
  auto t_o = false;
  CHECK(POSIX::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr,
                       1s, t_o));

  int peer;
  PCHECK((peer = accept(listener, nullptr, nullptr)) != -1);

  {
    Sock sock(fd, fd, 1s, 1s, 1s);
    CHECK_EQ(std::string{sock.us_c_str()}, "127.0.0.1");
    CHECK_EQ(std::string{sock.them_c_str()}, "127.0.0.1");
    CHECK(sock.has_peername());

    CHECK(!sock.input_ready(0ms));
    PCHECK(write(peer, "220 ok\r\n", 8) == 8);
    CHECK(sock.input_ready(1s));

    std::string line;
    CHECK(std::getline(sock.in(), line));
    CHECK_EQ(line, "220 ok\r");
    CHECK(!sock.timed_out());
  }

  close(fd);
  close(peer);
  close(listener);
}
