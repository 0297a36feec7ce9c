#ifndef SEND_DOT_HPP
#define SEND_DOT_HPP

#include "Sock.hpp"
#include "TenantConfig.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SMTP {

struct Envelope {
  std::string              mail_from;
  std::vector<std::string> rcpt_to;
  std::string              data; // CRLF lines, not dot-stuffed
};

// What the transport pool holds for one (host, port, username).
class Session {
public:
  virtual ~Session() = default;

  // Open a connection and get through greeting, TLS and AUTH.
  // Throws TransportError.
  virtual void verify() = 0;

  // Throws TransportError when no connection can be had, SendError
  // when the server refuses the transaction.  Returns the final reply.
  virtual std::string send(Envelope const& envelope) = 0;

  // Idempotent.
  virtual void close() = 0;
};

// One live connection to a server.
struct Connection {
  Connection(int fd, std::chrono::milliseconds timeout);

  Connection(Connection const&) = delete;
  Connection& operator=(Connection const&) = delete;

  ~Connection();

  int  fd;
  Sock sock;

  std::string server_id;

  std::string                                               ehlo_keyword;
  std::vector<std::string>                                  ehlo_param;
  std::unordered_map<std::string, std::vector<std::string>> ehlo_params;

  std::string reply_code;
  std::string reply; // text of the last reply, lines joined by ' '

  bool greeting_ok{false};
  bool ehlo_ok{false};

  int messages{0};

  bool has_extension(char const* name) const
  {
    return ehlo_params.find(name) != ehlo_params.end();
  }
  bool has_auth(char const* mechanism) const;
};

// Up to max_connections connections to one server, each retired after
// max_messages transactions.
class Client : public Session {
public:
  Client(Client const&) = delete;
  Client& operator=(Client const&) = delete;

  Client(SmtpConfig const& config, std::string helo_name);
  ~Client() override;

  void        verify() override;
  std::string send(Envelope const& envelope) override;
  void        close() override;

  int live_connections() const;

private:
  std::unique_ptr<Connection> open_();

  std::unique_ptr<Connection> checkout_();
  void checkin_(std::unique_ptr<Connection> conn);
  void discard_();

  SmtpConfig  config_;
  std::string helo_name_;

  mutable std::mutex                       mutex_;
  std::condition_variable                  idle_cv_;
  std::vector<std::unique_ptr<Connection>> idle_;

  int  live_{0};
  bool closed_{false};
};

// The name we give in EHLO: --helo_name, DELIVERD_HELO_NAME or the
// host name.
std::string helo_name();

} // namespace SMTP

#endif // SEND_DOT_HPP
