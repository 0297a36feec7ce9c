#include "DKIM-keygen.hpp"

#include "DNS-validate.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>

#include <boost/algorithm/string/erase.hpp>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
std::string ssl_error(char const* what)
{
  auto const err = ERR_get_error();
  char       buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  return fmt::format("{}: {}", what, buf);
}

std::string bio_str(BIO* bio)
{
  char* data = nullptr;
  auto  len  = BIO_get_mem_data(bio, &data);
  return std::string(data, len);
}

std::atomic<long long> last_selector_ms{0};
} // namespace

namespace DKIM {

std::string make_selector()
{
  using namespace std::chrono;
  auto const now
      = duration_cast<milliseconds>(system_clock::now().time_since_epoch())
            .count();

  // Never hand out the same selector twice, even within one millisecond.
  auto prev = last_selector_ms.load();
  auto next = now;
  do {
    next = std::max(now, prev + 1);
  } while (!last_selector_ms.compare_exchange_weak(prev, next));

  return fmt::format("sel{}", next);
}

Key_pair generate_key_pair(std::string const& domain, int bits)
{
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx{
      EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free};
  if (!ctx)
    throw std::runtime_error(ssl_error("EVP_PKEY_CTX_new_id"));

  if (EVP_PKEY_keygen_init(ctx.get()) <= 0)
    throw std::runtime_error(ssl_error("EVP_PKEY_keygen_init"));
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0)
    throw std::runtime_error(ssl_error("EVP_PKEY_CTX_set_rsa_keygen_bits"));

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0)
    throw std::runtime_error(ssl_error("EVP_PKEY_keygen"));
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey{raw, EVP_PKEY_free};

  std::unique_ptr<BIO, decltype(&BIO_free)> priv{BIO_new(BIO_s_mem()),
                                                 BIO_free};
  std::unique_ptr<BIO, decltype(&BIO_free)> pub{BIO_new(BIO_s_mem()),
                                                BIO_free};
  if (!priv || !pub)
    throw std::runtime_error(ssl_error("BIO_new"));

  if (PEM_write_bio_PrivateKey(priv.get(), pkey.get(), nullptr, nullptr, 0,
                               nullptr, nullptr)
      != 1)
    throw std::runtime_error(ssl_error("PEM_write_bio_PrivateKey"));
  if (PEM_write_bio_PUBKEY(pub.get(), pkey.get()) != 1)
    throw std::runtime_error(ssl_error("PEM_write_bio_PUBKEY"));

  Key_pair kp;
  kp.private_key = bio_str(priv.get());

  kp.public_key = bio_str(pub.get());
  boost::algorithm::erase_all(kp.public_key, "-----BEGIN PUBLIC KEY-----");
  boost::algorithm::erase_all(kp.public_key, "-----END PUBLIC KEY-----");
  boost::algorithm::erase_all(kp.public_key, "\n");
  boost::algorithm::erase_all(kp.public_key, "\r");

  kp.selector  = make_selector();
  kp.dns_name  = fmt::format("{}._domainkey.{}", kp.selector, domain);
  kp.dns_value = DNS::generate_dkim(kp.public_key);

  LOG(INFO) << "generated " << bits << " bit DKIM key, selector "
            << kp.selector;

  return kp;
}

} // namespace DKIM
