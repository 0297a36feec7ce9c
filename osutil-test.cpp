#include "osutil.hpp"

#include "Errors.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(!osutil::get_hostname().empty());

  CHECK_EQ(osutil::get_port("587", "tcp"), 587);
  CHECK_EQ(osutil::get_port("25", "tcp"), 25);

  auto threw = false;
  try {
    osutil::get_port("no-such-service-here", "tcp");
  }
  catch (ConfigurationError const&) {
    threw = true;
  }
  CHECK(threw);

  threw = false;
  try {
    osutil::get_port("70000", "tcp");
  }
  catch (ConfigurationError const&) {
    threw = true;
  }
  CHECK(threw);
}
