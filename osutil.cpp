#include "osutil.hpp"

#include "Errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <vector>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/utsname.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace osutil {

std::string get_hostname()
{
  utsname un;
  PCHECK(uname(&un) == 0);
  return std::string(un.nodename);
}

uint16_t get_port(char const* const service, char const* const proto)
{
  char*      ep = nullptr;
  auto const service_no{strtoul(service, &ep, 10)};
  if (ep && (ep != service) && (*ep == '\0')) {
    if (service_no > std::numeric_limits<uint16_t>::max())
      throw ConfigurationError(fmt::format("port {} out of range", service));
    return static_cast<uint16_t>(service_no);
  }

  std::vector<char> str_buf(1024); // suggested by getservbyname_r(3)

  auto     result_buf{servent{}};
  servent* result_ptr = nullptr;
  while (getservbyname_r(service, proto, &result_buf, str_buf.data(),
                         str_buf.size(), &result_ptr)
         == ERANGE) {
    CHECK_LT(str_buf.size(), 64 * 1024); // ridiculous
    str_buf.resize(str_buf.size() * 2);
  }
  if (result_ptr == nullptr)
    throw ConfigurationError(fmt::format("service {} unknown", service));

  return ntohs(result_buf.s_port);
}

} // namespace osutil
