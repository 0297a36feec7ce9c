#include "Now.hpp"

#include <cstring>
#include <sstream>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Now then;

  std::stringstream then_str;
  then_str << then;

  Now               then_again{then};
  std::stringstream then_again_str;
  then_again_str << then_again;

  CHECK_EQ(then_str.str(), then_again_str.str());
  CHECK_EQ(then, then_again);

  // "Tue, 06 Oct 2026 09:41:07 -0700"
  CHECK_EQ(strlen(then.c_str()), 31U);
  CHECK_EQ(then.c_str()[3], ',');

  Now later;
  CHECK_GE(later.ms(), then.ms());
}
