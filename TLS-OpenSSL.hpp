#ifndef TLS_OPENSSL_DOT_HPP
#define TLS_OPENSSL_DOT_HPP

#include <chrono>
#include <functional>
#include <ios>
#include <string>

#include <openssl/ssl.h>

namespace Config {
auto constexpr cert_verify_depth{10};
} // namespace Config

// Client side TLS over a pair of non-blocking file descriptors.
class TLS {
public:
  TLS(TLS const&) = delete;
  TLS& operator=(const TLS&) = delete;

  TLS() = default;
  ~TLS();

  // False on any handshake failure or timeout, the reason logged.
  bool starttls_client(int                       fd_in,
                       int                       fd_out,
                       char const*               server_name,
                       std::chrono::milliseconds timeout);

  bool pending() const { return ssl_ && SSL_pending(ssl_) > 0; }

  std::streamsize
  read(char* s, std::streamsize n, std::chrono::milliseconds wait, bool& t_o)
  {
    return io_tls_("SSL_read", SSL_read, s, n, wait, t_o);
  }
  std::streamsize write(const char*               c_s,
                        std::streamsize           n,
                        std::chrono::milliseconds wait,
                        bool&                     t_o)
  {
    auto s = const_cast<char*>(c_s);
    return io_tls_("SSL_write", SSL_write, s, n, wait, t_o);
  }

  std::string info() const;

  std::string const& verified_peername() const { return verified_peername_; }
  bool               verified() const { return verified_; }

private:
  std::streamsize io_tls_(char const*                          fnm,
                          std::function<int(SSL*, void*, int)> io_fnc,
                          char*                                s,
                          std::streamsize                      n,
                          std::chrono::milliseconds            wait,
                          bool&                                t_o);

  static void ssl_error(int n_get_err);

private:
  SSL_CTX* ctx_{nullptr};
  SSL*     ssl_{nullptr};

  std::string verified_peername_;
  bool        verified_{false};
};

#endif // TLS_OPENSSL_DOT_HPP
