#include "POSIX.hpp"

#include <cerrno>

#include <glog/logging.h>

#include <fcntl.h>
#include <sys/select.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::steady_clock;

namespace {
timeval to_timeval(milliseconds wait)
{
  auto tv{timeval{}};
  tv.tv_sec  = duration_cast<seconds>(wait).count();
  tv.tv_usec = (wait.count() % 1000) * 1000;
  return tv;
}

int select_one(int fd, bool for_read, milliseconds wait)
{
  for (;;) {
    auto fds{fd_set{}};
    FD_ZERO(&fds);
    FD_SET(fd, &fds);

    auto tv = to_timeval(wait);

    auto const puts = for_read ? select(fd + 1, &fds, nullptr, nullptr, &tv)
                               : select(fd + 1, nullptr, &fds, nullptr, &tv);
    if (puts != -1)
      return puts;
    PCHECK(errno == EINTR) << "select(2) failed";
  }
}
} // namespace

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  return 0 != select_one(fd_in, true, wait);
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  return 0 != select_one(fd_out, false, wait);
}

bool POSIX::connect(int             fd,
                    sockaddr const* addr,
                    socklen_t       addrlen,
                    milliseconds    timeout,
                    bool&           t_o)
{
  set_nonblocking(fd);

  if (::connect(fd, addr, addrlen) == 0)
    return true;

  if (errno != EINPROGRESS && errno != EINTR) {
    PLOG(WARNING) << "connect(2) failed";
    return false;
  }

  if (!output_ready(fd, timeout)) {
    t_o   = true;
    errno = ETIMEDOUT;
    LOG(WARNING) << "connect(2) timed out";
    return false;
  }

  int       err = 0;
  socklen_t len = sizeof(err);
  PCHECK(getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0);
  if (err != 0) {
    errno = err;
    PLOG(WARNING) << "connect(2) failed";
    return false;
  }

  return true;
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret >= 0)
      return n_ret;

    switch (errno) {
    case EINTR: continue; // try read again

    case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
    case EAGAIN:
#endif
      break;

    default: PLOG(WARNING) << "read(2) failed"; return -1;
    }

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try read again
    }
    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int             fd,
                             const char*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret = ::send(fd, static_cast<const void*>(s), n - written,
                              MSG_NOSIGNAL);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try write again

      case ENOTSOCK: {
        // pipes and files, in tests
        auto const w_ret
            = ::write(fd, static_cast<const void*>(s), n - written);
        if (w_ret == -1) {
          PLOG(WARNING) << "write(2) failed";
          return -1;
        }
        s += w_ret;
        written += w_ret;
        break;
      }

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "send(2) failed"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
    }
    t_o = true;
    LOG(WARNING) << "write(2) time out";
    return -1;
  }
}
