#include "Pill.hpp"

#include <iostream>
#include <sstream>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Pill red, blue;
  CHECK(red != blue);

  std::stringstream red_str, blue_str;

  red_str << red;
  blue_str << blue;

  CHECK_NE(red_str.str(), blue_str.str());

  // 64 bits, five per digit.
  CHECK_EQ(13U, red_str.str().length());
  CHECK_EQ(13U, blue_str.str().length());

  for (auto ch : red.as_string_view()) {
    CHECK((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z'))
        << "bad char " << ch;
  }

  Pill red2(red);
  CHECK_EQ(red, red2);

  std::cout << red << '\n' << blue << '\n';
}
