// make a DKIM key pair and the TXT record to publish for it

#include "DKIM-keygen.hpp"

#include <fstream>
#include <iostream>

#include <gflags/gflags.h>

DEFINE_string(domain, "", "signing domain");
DEFINE_int32(bits, Config::dkim_key_bits, "RSA key size");
DEFINE_string(key_file, "", "write the private key here, else to stdout");

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("dkimgen --domain=DOMAIN [--key_file=FILE]");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_domain.empty()) {
    LOG(ERROR) << "--domain is required";
    return 1;
  }

  auto const pair = DKIM::generate_key_pair(FLAGS_domain, FLAGS_bits);

  if (FLAGS_key_file.empty()) {
    std::cout << pair.private_key;
  }
  else {
    std::ofstream key(FLAGS_key_file);
    PCHECK(key) << "can't open " << FLAGS_key_file;
    key << pair.private_key;
    PCHECK(key.flush()) << "can't write " << FLAGS_key_file;
    LOG(INFO) << "private key written to " << FLAGS_key_file;
  }

  std::cout << "selector " << pair.selector << '\n'
            << pair.dns_name << " IN TXT \"" << pair.dns_value << "\"\n";
}
