#include "SockBuffer.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  boost::iostreams::stream<SockBuffer> client{fds[0], fds[0], 200ms, 1s, 1s};
  boost::iostreams::stream<SockBuffer> server{fds[1], fds[1], 1s, 1s, 1s};

  CHECK(!client->input_ready(0ms));
  CHECK(client->output_ready(0ms));
  CHECK(!client->tls());
  CHECK(client->tls_info().empty());

  server << "220 relay.test ESMTP\r\n" << std::flush;
  CHECK(client->input_ready(1s));

  std::string line;
  CHECK(std::getline(client, line));
  CHECK_EQ(line, "220 relay.test ESMTP\r");

  client << "EHLO client.test\r\nQUIT\r\n" << std::flush;
  CHECK(std::getline(server, line));
  CHECK_EQ(line, "EHLO client.test\r");
  CHECK(std::getline(server, line));
  CHECK_EQ(line, "QUIT\r");

  // Nothing more is coming.
  CHECK(!client->timed_out());
  CHECK(!std::getline(client, line));
  CHECK(client->timed_out());

  client->log_totals();

  close(fds[0]);
  close(fds[1]);
}
