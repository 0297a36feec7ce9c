#ifndef ERRORS_DOT_HPP
#define ERRORS_DOT_HPP

#include <chrono>
#include <stdexcept>
#include <string>

// Missing or invalid required fields for the selected provider.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

// Handshake, TLS or authentication failure while acquiring a session.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

// Per-message failure after a session was acquired.
class SendError : public std::runtime_error {
public:
  explicit SendError(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

// Local admission denial, raised before any network I/O.
class RateLimitError : public SendError {
public:
  RateLimitError(std::string const& what, std::chrono::milliseconds wait)
    : SendError(what)
    , wait_(wait)
  {
  }

  std::chrono::milliseconds wait() const { return wait_; }

private:
  std::chrono::milliseconds wait_;
};

// Every provider in the fallback chain was unusable.
class NoProviderAvailable : public std::runtime_error {
public:
  explicit NoProviderAvailable(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

class DnsLookupError : public std::runtime_error {
public:
  explicit DnsLookupError(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

// Malformed recipient address, rejected before any network call.
class ValidationError : public std::runtime_error {
public:
  explicit ValidationError(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

#endif // ERRORS_DOT_HPP
