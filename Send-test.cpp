#include "Send.hpp"

#include "Base64.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
// One exchange: the command the server waits for (a prefix of the
// line) and what it says back.  An empty command means speak first;
// "." means read message data up to the lone dot.
using Step = std::pair<std::string, std::string>;

class Fake_server {
public:
  explicit Fake_server(std::vector<Step> script)
    : script_(std::move(script))
  {
    PCHECK((listen_fd_ = socket(AF_INET, SOCK_STREAM, 0)) != -1);

    auto addr{sockaddr_in{}};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    PCHECK(bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof addr)
           == 0);
    PCHECK(listen(listen_fd_, 1) == 0);

    socklen_t len = sizeof addr;
    PCHECK(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len)
           == 0);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { run_(); });
  }

  ~Fake_server()
  {
    if (thread_.joinable())
      thread_.join();
    close(listen_fd_);
  }

  uint16_t port() const { return port_; }

  // Everything read from the client, after the thread is done.
  std::vector<std::string> const& lines()
  {
    if (thread_.joinable())
      thread_.join();
    return lines_;
  }

private:
  bool read_line_(int fd, std::string& line)
  {
    line.clear();
    char ch;
    while (::read(fd, &ch, 1) == 1) {
      line += ch;
      if (line.size() >= 2 && line.compare(line.size() - 2, 2, "\r\n") == 0) {
        line.resize(line.size() - 2);
        return true;
      }
    }
    return false;
  }

  void write_(int fd, std::string const& reply)
  {
    PCHECK(::write(fd, reply.data(), reply.size())
           == static_cast<ssize_t>(reply.size()));
  }

  void run_()
  {
    int fd;
    PCHECK((fd = accept(listen_fd_, nullptr, nullptr)) != -1);

    std::string line;
    for (auto const& [cmd, reply] : script_) {
      if (cmd == ".") {
        while (read_line_(fd, line) && line != ".")
          lines_.push_back(line);
        lines_.push_back(".");
      }
      else if (!cmd.empty()) {
        CHECK(read_line_(fd, line)) << "wanted " << cmd;
        CHECK_EQ(line.find(cmd), 0u) << line;
        lines_.push_back(line);
      }
      write_(fd, reply);
    }

    // Drain until the client hangs up.
    while (read_line_(fd, line))
      lines_.push_back(line);
    close(fd);
  }

  std::vector<Step> script_;

  int      listen_fd_{-1};
  uint16_t port_{0};

  std::thread              thread_;
  std::vector<std::string> lines_;
};

SmtpConfig relay(uint16_t port)
{
  SmtpConfig config;
  config.host             = "127.0.0.1";
  config.port             = port;
  config.username         = "mailer";
  config.password         = "secret";
  config.from_email       = "news@example.com";
  config.greeting_timeout = std::chrono::seconds(5);
  config.socket_timeout   = std::chrono::seconds(5);
  return config;
}

bool contains(std::vector<std::string> const& lines, std::string const& line)
{
  return std::find(begin(lines), end(lines), line) != end(lines);
}

void check_transaction()
{
  auto const auth = Base64::enc("\0mailer\0secret"s);

  Fake_server server{{
      {"", "220 relay.test ESMTP ready\r\n"},
      {"EHLO ", "250-relay.test\r\n"
                "250-PIPELINING\r\n"
                "250-8BITMIME\r\n"
                "250 AUTH PLAIN LOGIN\r\n"},
      {"AUTH PLAIN " + auth, "235 2.7.0 Authentication successful\r\n"},
      {"MAIL FROM:<news@example.com> BODY=8BITMIME", "250 2.1.0 Ok\r\n"},
      {"RCPT TO:<reader@example.net>", "250 2.1.5 Ok\r\n"},
      {"DATA", "354 End data with <CR><LF>.<CR><LF>\r\n"},
      {".", "250 2.0.0 Ok: queued as 4ABC\r\n"},
      {"MAIL FROM:<news@example.com>", "250 2.1.0 Ok\r\n"},
      {"RCPT TO:<nobody@example.net>", "550 5.1.1 User unknown\r\n"},
      {"RSET", "250 2.0.0 Ok\r\n"},
      {"QUIT", "221 2.0.0 Bye\r\n"},
  }};

  auto const config = relay(server.port());
  SMTP::Client client{config, "client.test"};

  client.verify();
  CHECK_EQ(client.live_connections(), 1);

  SMTP::Envelope envelope;
  envelope.mail_from = "news@example.com";
  envelope.rcpt_to.push_back("reader@example.net");
  envelope.data = "Subject: test\r\n"
                  "\r\n"
                  "first line\r\n"
                  ".hidden\r\n"
                  "last line\n";

  auto const reply = client.send(envelope);
  CHECK_EQ(reply, "250 2.0.0 Ok: queued as 4ABC");

  envelope.rcpt_to = {"nobody@example.net"};
  auto threw       = false;
  try {
    client.send(envelope);
  }
  catch (SendError const& e) {
    threw = true;
    CHECK_EQ(std::string{e.what()}, "recipient «nobody@example.net» "
                                    "rejected: 550 5.1.1 User unknown");
  }
  CHECK(threw);
  CHECK_EQ(client.live_connections(), 1); // RSET kept it

  client.close();
  client.close();
  CHECK_EQ(client.live_connections(), 0);

  auto const& lines = server.lines();
  CHECK(contains(lines, "EHLO client.test"));
  CHECK(contains(lines, "first line"));
  CHECK(contains(lines, "..hidden")); // dot stuffed
  CHECK(contains(lines, "last line"));
  CHECK(contains(lines, "QUIT"));

  // Closed for good.
  threw = false;
  try {
    client.verify();
  }
  catch (TransportError const&) {
    threw = true;
  }
  CHECK(threw);
}

void check_refusals()
{
  {
    Fake_server server{{
        {"", "554 5.3.2 not accepting mail\r\n"},
    }};
    SMTP::Client client{relay(server.port()), "client.test"};
    auto         threw = false;
    try {
      client.verify();
    }
    catch (TransportError const& e) {
      threw = true;
      CHECK_NE(std::string{e.what()}.find("refused the connection"),
               std::string::npos);
    }
    CHECK(threw);
    CHECK_EQ(client.live_connections(), 0);
  }
  {
    Fake_server server{{
        {"", "220 relay.test\r\n"},
        {"EHLO ", "250-relay.test\r\n"
                  "250 AUTH LOGIN\r\n"},
        {"AUTH LOGIN", "334 VXNlcm5hbWU6\r\n"},
        {Base64::enc("mailer"), "334 UGFzc3dvcmQ6\r\n"},
        {Base64::enc("secret"), "535 5.7.8 Authentication credentials "
                                "invalid\r\n"},
    }};
    SMTP::Client client{relay(server.port()), "client.test"};
    auto         threw = false;
    try {
      client.verify();
    }
    catch (TransportError const& e) {
      threw = true;
      CHECK_EQ(std::string{e.what()},
               "authentication as mailer failed: 535 5.7.8 Authentication "
               "credentials invalid");
    }
    CHECK(threw);
  }
  {
    // Nobody listening.
    int fd;
    PCHECK((fd = socket(AF_INET, SOCK_STREAM, 0)) != -1);
    auto addr{sockaddr_in{}};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    PCHECK(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr) == 0);
    socklen_t len = sizeof addr;
    PCHECK(getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    auto const port = ntohs(addr.sin_port);
    close(fd);

    SMTP::Client client{relay(port), "client.test"};
    auto         threw = false;
    try {
      client.verify();
    }
    catch (TransportError const& e) {
      threw = true;
      CHECK_EQ(std::string{e.what()},
               "can't connect to 127.0.0.1:" + std::to_string(port));
    }
    CHECK(threw);
  }
}

void check_bad_static_ip()
{
  auto config      = relay(25);
  config.static_ip = "not-an-address";

  SMTP::Client client{config, "client.test"};
  auto         threw = false;
  try {
    client.verify();
  }
  catch (ConfigurationError const&) {
    threw = true;
  }
  CHECK(threw);
  CHECK_EQ(client.live_connections(), 0);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(!SMTP::helo_name().empty());

  check_transaction();
  check_refusals();
  check_bad_static_ip();
}
