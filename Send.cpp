#include "Send.hpp"

#include "Base64.hpp"
#include "Errors.hpp"
#include "iequal.hpp"
#include "osutil.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string_view>

#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

#include <gflags/gflags.h>

// This needs to be at least the length of each string it's trying to match.
DEFINE_uint64(pbfr_size, 4 * 1024, "parser buffer size");

DEFINE_bool(use_esmtp, true, "use ESMTP (EHLO)");

DEFINE_string(helo_name, "", "name to give in EHLO, default is the host name");

#include <boost/algorithm/string/case_conv.hpp>

#include <glog/logging.h>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

using std::begin;
using std::end;

namespace chars {
// clang-format off
struct tail : range<'\x80', '\xBF'> {};

struct ch_2 : seq<range<'\xC2', '\xDF'>, tail> {};

struct ch_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, tail>,
                  seq<range<'\xE1', '\xEC'>, rep<2, tail>>,
                  seq<one<'\xED'>, range<'\x80', '\x9F'>, tail>,
                  seq<range<'\xEE', '\xEF'>, rep<2, tail>>> {};

struct ch_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, tail>>,
                  seq<range<'\xF1', '\xF3'>, rep<3, tail>>,
                  seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, tail>>> {};

struct non_ascii : sor<ch_2, ch_3, ch_4> {};
// clang-format on
} // namespace chars

namespace SMTP {

// clang-format off

using dot = one<'.'>;
using dash = one<'-'>;

struct let_dig : sor<ALPHA, DIGIT, chars::non_ascii> {};

struct ldh_tail : star<sor<seq<plus<dash>, let_dig>, let_dig>> {};

struct label : seq<let_dig, ldh_tail> {};

struct domain : list<label, dot> {};

// Whatever is between the brackets, IPv4, IPv6 or general.
struct dcontent : ranges<33, 90, 94, 126> {};

struct address_literal : seq<one<'['>, plus<dcontent>, one<']'>> {};

// RFC 6531 allows UTF-8 in the replies.
struct textstring : plus<sor<one<9>, range<32, 126>, chars::non_ascii>> {};

struct server_id : sor<domain, address_literal> {};

// Greeting       = ( "220 " (Domain / address-literal) [ SP textstring ] CRLF )
//                  /
//                  ( "220-" (Domain / address-literal) [ SP textstring ] CRLF
//                 *( "220-" [ textstring ] CRLF )
//                    "220 " [ textstring ] CRLF )

struct greeting_ok
: sor<seq<TAO_PEGTL_ISTRING("220 "), server_id, opt<textstring>, CRLF>,
      seq<TAO_PEGTL_ISTRING("220-"), server_id, opt<textstring>, CRLF,
 star<seq<TAO_PEGTL_ISTRING("220-"), opt<textstring>, CRLF>>,
      seq<TAO_PEGTL_ISTRING("220 "), opt<textstring>, CRLF>>> {};

// Reply-code     = %x32-35 %x30-35 %x30-39

struct reply_code
: seq<range<0x32, 0x35>, range<0x30, 0x35>, range<0x30, 0x39>> {};

// Reply-line     = *( Reply-code "-" [ textstring ] CRLF )
//                     Reply-code  [ SP textstring ] CRLF

struct reply_lines
: seq<star<seq<reply_code, dash, opt<textstring>, CRLF>>,
           seq<reply_code, opt<seq<SP, textstring>>, CRLF>> {};

struct greeting
  : sor<greeting_ok, reply_lines> {};

// ehlo-greet     = 1*(%d0-9 / %d11-12 / %d14-127)

struct ehlo_greet : plus<ranges<0, 9, 11, 12, 14, 127>> {};

// ehlo-keyword   = (ALPHA / DIGIT) *(ALPHA / DIGIT / "-")

// Some servers put a '.' in a keyword.

struct ehlo_keyword : seq<sor<ALPHA, DIGIT>, star<sor<ALPHA, DIGIT, dash, dot>>> {};

// ehlo-param     = 1*(%d33-126)

struct ehlo_param : plus<range<33, 126>> {};

// ehlo-line      = ehlo-keyword *( SP ehlo-param )

// Postfix and friends still send "AUTH=LOGIN PLAIN".

struct ehlo_line
    : seq<ehlo_keyword, star<seq<sor<SP, one<'='>>, ehlo_param>>> {};

// ehlo-ok-rsp    = ( "250 " Domain [ SP ehlo-greet ] CRLF )
//                  /
//                  ( "250-" Domain [ SP ehlo-greet ] CRLF
//                 *( "250-" ehlo-line CRLF )
//                    "250 " ehlo-line CRLF )

struct ehlo_ok_rsp
: sor<seq<TAO_PEGTL_ISTRING("250 "), server_id, opt<ehlo_greet>, CRLF>,

      seq<TAO_PEGTL_ISTRING("250-"), server_id, opt<ehlo_greet>, CRLF,
 star<seq<TAO_PEGTL_ISTRING("250-"), ehlo_line, CRLF>>,
      seq<TAO_PEGTL_ISTRING("250 "), opt<ehlo_line>, CRLF>>
      > {};

struct ehlo_rsp
  : sor<ehlo_ok_rsp, reply_lines> {};

struct helo_ok_rsp
  : seq<TAO_PEGTL_ISTRING("250 "), server_id, opt<ehlo_greet>, CRLF> {};

// clang-format on

namespace {
// Log each line as received and keep them as the reply text.
template <typename Input>
void log_reply(Input const& in, Connection& conn)
{
  conn.reply.clear();
  std::string_view text{in.begin(), in.size()};
  while (!text.empty()) {
    auto const eol  = text.find("\r\n");
    auto const line = text.substr(0, eol);
    text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 2);

    LOG(INFO) << "S: " << line;
    if (!conn.reply.empty())
      conn.reply += ' ';
    conn.reply += line;
  }
}
} // namespace

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<server_id> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.server_id = in.string();
  }
};

template <>
struct action<greeting_ok> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.greeting_ok = true;
    conn.reply_code  = "220";
    log_reply(in, conn);
  }
};

template <>
struct action<ehlo_ok_rsp> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_ok    = true;
    conn.reply_code = "250";
    log_reply(in, conn);
  }
};

template <>
struct action<helo_ok_rsp> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.reply_code = "250";
    log_reply(in, conn);
  }
};

template <>
struct action<ehlo_keyword> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_keyword = in.string();
    boost::to_upper(conn.ehlo_keyword);
  }
};

template <>
struct action<ehlo_param> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_param.push_back(in.string());
  }
};

template <>
struct action<ehlo_line> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_params.insert_or_assign(std::move(conn.ehlo_keyword),
                                      std::move(conn.ehlo_param));
    conn.ehlo_keyword.clear();
    conn.ehlo_param.clear();
  }
};

template <>
struct action<reply_lines> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    log_reply(in, conn);
  }
};

template <>
struct action<reply_code> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.reply_code = in.string();
  }
};

namespace {
template <typename Rule>
bool read_reply(Connection& conn, char const* source)
{
  auto in = istream_input<eol::crlf, 1>{conn.sock.in(), FLAGS_pbfr_size,
                                        source};
  try {
    return parse<Rule, action>(in, conn);
  }
  catch (std::runtime_error const& e) {
    LOG(WARNING) << source << ": " << e.what();
    return false;
  }
}

// Send one command line and parse the reply; false on any I/O or
// syntax failure.
bool do_cmd(Connection& conn, std::string const& cmd, char const* shown = nullptr)
{
  LOG(INFO) << "C: " << (shown ? shown : cmd.c_str());
  conn.sock.out() << cmd << "\r\n" << std::flush;
  if (!conn.sock.out().good()) {
    LOG(WARNING) << "write to " << conn.server_id << " failed";
    return false;
  }
  conn.reply_code.clear();
  if (!read_reply<reply_lines>(conn, "reply")) {
    LOG(WARNING) << "reply from " << conn.server_id << " unparseable";
    return false;
  }
  return true;
}

bool positive(Connection const& conn)
{
  return !conn.reply_code.empty() && conn.reply_code.front() == '2';
}

std::string io_error(Connection& conn, char const* during)
{
  if (conn.sock.timed_out())
    return fmt::format("timed out waiting for {} reply from {}", during,
                       conn.server_id);
  return fmt::format("connection to {} lost during {}", conn.server_id,
                     during);
}

int connect_to(SmtpConfig const& config)
{
  auto hints{addrinfo{}};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags    = AI_NUMERICSERV;
  hints.ai_family   = AF_UNSPEC;

  auto      local{sockaddr_storage{}};
  socklen_t local_len = 0;
  if (config.static_ip) {
    auto const ip  = config.static_ip->c_str();
    auto const in4 = reinterpret_cast<sockaddr_in*>(&local);
    auto const in6 = reinterpret_cast<sockaddr_in6*>(&local);
    if (inet_pton(AF_INET, ip, &in4->sin_addr) == 1) {
      in4->sin_family = AF_INET;
      local_len       = sizeof(sockaddr_in);
      hints.ai_family = AF_INET;
    }
    else if (inet_pton(AF_INET6, ip, &in6->sin6_addr) == 1) {
      in6->sin6_family = AF_INET6;
      local_len        = sizeof(sockaddr_in6);
      hints.ai_family  = AF_INET6;
    }
    else {
      throw ConfigurationError(
          fmt::format("can't interpret staticIp «{}» as an address", ip));
    }
  }

  auto const port = std::to_string(config.port);

  addrinfo* res = nullptr;
  if (auto const rc
      = getaddrinfo(config.host.c_str(), port.c_str(), &hints, &res);
      rc != 0) {
    throw TransportError(fmt::format("can't resolve «{}»: {}", config.host,
                                     gai_strerror(rc)));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs{res, freeaddrinfo};

  for (auto ai = addrs.get(); ai; ai = ai->ai_next) {
    int const fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      PLOG(WARNING) << "socket() failed";
      continue;
    }
    if (local_len
        && bind(fd, reinterpret_cast<sockaddr const*>(&local), local_len)
               != 0) {
      PLOG(WARNING) << "bind to " << *config.static_ip << " failed";
      close(fd);
      continue;
    }
    auto t_o = false;
    if (POSIX::connect(fd, ai->ai_addr, ai->ai_addrlen,
                       config.connection_timeout, t_o)) {
      return fd;
    }
    LOG(WARNING) << "no connection to " << config.host << ":" << config.port
                 << (t_o ? " (timed out)" : "");
    close(fd);
  }

  throw TransportError(fmt::format("can't connect to {}:{}", config.host,
                                   config.port));
}

bool do_ehlo(Connection& conn, std::string const& helo_name)
{
  conn.ehlo_ok = false;
  conn.ehlo_params.clear();

  if (FLAGS_use_esmtp) {
    LOG(INFO) << "C: EHLO " << helo_name;
    conn.sock.out() << "EHLO " << helo_name << "\r\n" << std::flush;
    if (read_reply<ehlo_rsp>(conn, "ehlo") && conn.ehlo_ok)
      return true;
    if (!conn.sock.in().good())
      return false;
    LOG(WARNING) << "EHLO not accepted, trying HELO";
  }

  LOG(INFO) << "C: HELO " << helo_name;
  conn.sock.out() << "HELO " << helo_name << "\r\n" << std::flush;
  return read_reply<helo_ok_rsp>(conn, "helo");
}

bool do_auth(Connection& conn, SmtpConfig const& config, std::string& error)
{
  auto const advertised = conn.has_extension("AUTH");

  if (!advertised || conn.has_auth("PLAIN")) {
    std::string creds;
    creds += '\0';
    creds += config.username;
    creds += '\0';
    creds += config.password;
    if (!do_cmd(conn, "AUTH PLAIN " + Base64::enc(creds), "AUTH PLAIN ****")) {
      error = io_error(conn, "AUTH PLAIN");
      return false;
    }
    if (conn.reply_code == "235")
      return true;
    LOG(WARNING) << "AUTH PLAIN refused: " << conn.reply;
  }

  if (!advertised || conn.has_auth("LOGIN")) {
    if (!do_cmd(conn, "AUTH LOGIN")
        || (conn.reply_code == "334"
            && (!do_cmd(conn, Base64::enc(config.username), "****")
                || (conn.reply_code == "334"
                    && !do_cmd(conn, Base64::enc(config.password),
                               "****"))))) {
      error = io_error(conn, "AUTH LOGIN");
      return false;
    }
    if (conn.reply_code == "235")
      return true;
    LOG(WARNING) << "AUTH LOGIN refused: " << conn.reply;
  }

  error = fmt::format("authentication as {} failed: {}", config.username,
                      conn.reply.empty() ? "no usable mechanism" : conn.reply);
  return false;
}

void write_data(Connection& conn, std::string_view data)
{
  auto& out = conn.sock.out();

  std::string_view::size_type pos = 0;
  while (pos < data.size()) {
    auto const nl = data.find('\n', pos);
    auto       line
        = data.substr(pos, nl == std::string_view::npos ? nl : nl - pos);
    pos = nl == std::string_view::npos ? data.size() : nl + 1;

    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    if (!line.empty() && line.front() == '.')
      out << '.';
    out << line << "\r\n";
  }
  out << ".\r\n" << std::flush;
}

bool do_transaction(Connection&       conn,
                    Envelope const&   envelope,
                    std::string&      error)
{
  auto const body = conn.has_extension("8BITMIME") ? " BODY=8BITMIME" : "";

  if (!do_cmd(conn, fmt::format("MAIL FROM:<{}>{}", envelope.mail_from, body))) {
    error = io_error(conn, "MAIL FROM");
    return false;
  }
  if (!positive(conn)) {
    error = fmt::format("MAIL FROM:<{}> rejected: {}", envelope.mail_from,
                        conn.reply);
    return false;
  }

  for (auto const& to : envelope.rcpt_to) {
    if (!do_cmd(conn, fmt::format("RCPT TO:<{}>", to))) {
      error = io_error(conn, "RCPT TO");
      return false;
    }
    if (!positive(conn)) {
      error = fmt::format("recipient «{}» rejected: {}", to, conn.reply);
      return false;
    }
  }

  if (!do_cmd(conn, "DATA")) {
    error = io_error(conn, "DATA");
    return false;
  }
  if (conn.reply_code != "354") {
    error = fmt::format("DATA rejected: {}", conn.reply);
    return false;
  }

  write_data(conn, envelope.data);
  if (!conn.sock.out().good()) {
    conn.sock.log_totals();
    error = io_error(conn, "message data");
    return false;
  }

  conn.reply_code.clear();
  if (!read_reply<reply_lines>(conn, "data")) {
    error = io_error(conn, "end of data");
    return false;
  }
  if (!positive(conn)) {
    error = fmt::format("message refused: {}", conn.reply);
    return false;
  }
  return true;
}

void do_quit(Connection& conn)
{
  if (!do_cmd(conn, "QUIT"))
    LOG(INFO) << "no reply to QUIT from " << conn.server_id;
}
} // namespace

Connection::Connection(int fd_in, std::chrono::milliseconds timeout)
  : fd(fd_in)
  , sock(fd_in, fd_in, timeout, timeout, timeout)
{
}

Connection::~Connection() { ::close(fd); }

bool Connection::has_auth(char const* mechanism) const
{
  auto const auth = ehlo_params.find("AUTH");
  if (auth == ehlo_params.end())
    return false;
  return std::any_of(begin(auth->second), end(auth->second),
                     [mechanism](auto const& m) { return iequal(m, mechanism); });
}

Client::Client(SmtpConfig const& config, std::string helo_name)
  : config_(config)
  , helo_name_(std::move(helo_name))
{
}

Client::~Client() { close(); }

std::unique_ptr<Connection> Client::open_()
{
  auto const host = fmt::format("{}:{}", config_.host, config_.port);

  auto conn = std::make_unique<Connection>(connect_to(config_),
                                           config_.socket_timeout);
  LOG(INFO) << "connected to " << host
            << (conn->sock.has_peername()
                    ? fmt::format(" ({})", conn->sock.them_c_str())
                    : std::string{})
            << " from " << conn->sock.us_c_str();

  if (config_.secure && !conn->sock.starttls_client(config_.host.c_str()))
    throw TransportError(fmt::format("TLS handshake with {} failed", host));

  conn->sock.set_read_timeout(config_.greeting_timeout);
  if (!read_reply<greeting>(*conn, "greeting")) {
    if (conn->sock.timed_out())
      throw TransportError(
          fmt::format("timed out waiting for greeting from {}", host));
    throw TransportError(
        fmt::format("greeting from {} was unrecognizable", host));
  }
  conn->sock.set_read_timeout(config_.socket_timeout);
  if (!conn->greeting_ok)
    throw TransportError(
        fmt::format("{} refused the connection: {}", host, conn->reply));

  if (!do_ehlo(*conn, helo_name_))
    throw TransportError(fmt::format("{} did not accept HELO: {}", host,
                                     io_error(*conn, "HELO")));

  if (!conn->sock.tls() && config_.enable_tls
      && conn->has_extension("STARTTLS")) {
    if (!do_cmd(*conn, "STARTTLS"))
      throw TransportError(io_error(*conn, "STARTTLS"));
    if (conn->reply_code == "220") {
      if (!conn->sock.starttls_client(config_.host.c_str()))
        throw TransportError(fmt::format("STARTTLS with {} failed", host));
      // RFC 3207 section 4.2, forget what we learned in the clear.
      if (!do_ehlo(*conn, helo_name_))
        throw TransportError(io_error(*conn, "EHLO after STARTTLS"));
    }
    else {
      LOG(WARNING) << "STARTTLS refused by " << host << ": " << conn->reply;
    }
  }

  if (config_.require_tls && !conn->sock.tls())
    throw TransportError(
        fmt::format("TLS is required but {} did not negotiate it", host));

  if (conn->sock.tls())
    LOG(INFO) << conn->sock.tls_info();

  if (!config_.username.empty()) {
    std::string error;
    if (!do_auth(*conn, config_, error))
      throw TransportError(error);
  }

  return conn;
}

std::unique_ptr<Connection> Client::checkout_()
{
  {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
      if (closed_)
        throw TransportError(
            fmt::format("session for {} is closed", config_.key()));
      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (!conn->sock.input_ready(std::chrono::milliseconds(0)))
          return conn;
        // Anything unsolicited on an idle connection is a 421 or EOF.
        LOG(INFO) << "dropping stale connection to " << conn->server_id;
        break;
      }
      if (live_ < config_.max_connections) {
        ++live_;
        break;
      }
      idle_cv_.wait(lock);
    }
  }

  try {
    return open_();
  }
  catch (std::runtime_error const&) {
    discard_();
    throw;
  }
}

void Client::checkin_(std::unique_ptr<Connection> conn)
{
  if (conn->messages >= config_.max_messages) {
    LOG(INFO) << "retiring connection to " << conn->server_id << " after "
              << conn->messages << " messages";
    do_quit(*conn);
    conn.reset();
    discard_();
    return;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (closed_) {
    lock.unlock();
    do_quit(*conn);
    conn.reset();
    discard_();
    return;
  }
  idle_.push_back(std::move(conn));
  lock.unlock();
  idle_cv_.notify_one();
}

void Client::discard_()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    CHECK_GT(live_, 0);
    --live_;
  }
  idle_cv_.notify_one();
}

void Client::verify()
{
  checkin_(checkout_());
}

std::string Client::send(Envelope const& envelope)
{
  auto conn = checkout_();

  std::string error;
  if (do_transaction(*conn, envelope, error)) {
    ++conn->messages;
    auto reply = conn->reply;
    checkin_(std::move(conn));
    return reply;
  }

  LOG(WARNING) << error;
  if (conn->sock.in().good() && conn->sock.out().good()
      && do_cmd(*conn, "RSET") && positive(*conn)) {
    checkin_(std::move(conn));
  }
  else {
    conn.reset();
    discard_();
  }
  throw SendError(error);
}

void Client::close()
{
  std::vector<std::unique_ptr<Connection>> idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return;
    closed_ = true;
    idle.swap(idle_);
    live_ -= static_cast<int>(idle.size());
  }
  idle_cv_.notify_all();

  for (auto& conn : idle)
    do_quit(*conn);
}

int Client::live_connections() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return live_;
}

std::string helo_name()
{
  if (!FLAGS_helo_name.empty())
    return FLAGS_helo_name;
  if (auto const env = getenv("DELIVERD_HELO_NAME"); env != nullptr)
    return env;
  return osutil::get_hostname();
}

} // namespace SMTP
