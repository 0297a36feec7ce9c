#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <cstdint>
#include <string>

namespace osutil {
std::string get_hostname();

// Numeric port or service name from /etc/services; throws
// ConfigurationError for an unknown service.
uint16_t get_port(char const* const service, char const* const proto);
} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED
