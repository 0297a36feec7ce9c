#include "DKIM.hpp"

#include "Errors.hpp"

#include <cstring>
#include <memory>
#include <vector>

#include <stdbool.h> // needs to be above <dkim.h>

#include <dkim.h>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
// Not nice to use "unsigned char" for character data.
u_char* uc(char const* cp)
{
  return reinterpret_cast<u_char*>(const_cast<char*>(cp));
}

char const* c(unsigned char* ucp) { return reinterpret_cast<char const*>(ucp); }

constexpr unsigned char id_s[]{"DKIM::Signer"};

// Split at the blank line, and unfold nothing: libopendkim wants each
// header field whole, continuation lines included.
void feed(DKIM::Signer& signer, std::string_view message)
{
  auto const eoh = message.find("\r\n\r\n");
  auto const hdrs
      = message.substr(0, eoh == std::string_view::npos ? message.size() : eoh + 2);
  auto const body = eoh == std::string_view::npos ? std::string_view{}
                                                   : message.substr(eoh + 4);

  std::string field;
  size_t      pos = 0;
  while (pos < hdrs.size()) {
    auto nl = hdrs.find("\r\n", pos);
    if (nl == std::string_view::npos)
      nl = hdrs.size();
    auto const line = hdrs.substr(pos, nl - pos);
    pos             = nl + 2;

    if (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
      field += "\r\n";
      field += line;
      continue;
    }
    if (!field.empty())
      signer.header(field);
    field = line;
  }
  if (!field.empty())
    signer.header(field);

  signer.eoh();
  signer.body(body);
  signer.eom();
}
} // namespace

namespace DKIM {

Signer::Signer(std::string const& private_key,
               std::string const& selector,
               std::string const& domain)
  : lib_(dkim_init(nullptr, nullptr))
{
  if (lib_ == nullptr)
    throw ConfigurationError("dkim_init failed");

  // clang-format off
  dkim_ = dkim_sign(lib_,
                    id_s,
                    nullptr,
                    uc(private_key.c_str()),
                    uc(selector.c_str()),
                    uc(domain.c_str()),
                    DKIM_CANON_RELAXED,
                    DKIM_CANON_RELAXED,
                    DKIM_SIGN_RSASHA256,
                    -1,
                    &status_);
  // clang-format on
  if (dkim_ == nullptr || status_ != DKIM_STAT_OK) {
    auto const msg = fmt::format("DKIM signing setup failed for {}: {}",
                                 domain, dkim_getresultstr(status_));
    if (dkim_ != nullptr)
      dkim_free(dkim_);
    dkim_close(lib_);
    throw ConfigurationError(msg);
  }

  dkim_signhdrs(dkim_, const_cast<char const**>(Config::dkim_signed_headers));
}

Signer::~Signer()
{
  dkim_free(dkim_);
  dkim_close(lib_);
}

void Signer::header(std::string_view header)
{
  if (header.size() && header.back() == '\n')
    header.remove_suffix(1);
  if (header.size() && header.back() == '\r')
    header.remove_suffix(1);

  status_ = dkim_header(dkim_, uc(header.data()), header.length());
  if (status_ != DKIM_STAT_OK)
    throw SendError(
        fmt::format("dkim_header error: {}", dkim_getresultstr(status_)));
}

void Signer::eoh()
{
  status_ = dkim_eoh(dkim_);
  if (status_ != DKIM_STAT_OK)
    throw SendError(
        fmt::format("dkim_eoh error: {}", dkim_getresultstr(status_)));
}

void Signer::body(std::string_view body)
{
  status_ = dkim_body(dkim_, uc(body.data()), body.length());
  if (status_ != DKIM_STAT_OK)
    throw SendError(
        fmt::format("dkim_body error: {}", dkim_getresultstr(status_)));
}

void Signer::eom()
{
  status_ = dkim_eom(dkim_, nullptr);
  if (status_ != DKIM_STAT_OK)
    throw SendError(
        fmt::format("dkim_eom error: {}", dkim_getresultstr(status_)));
}

std::string Signer::getsighdr()
{
  auto const     initial{strlen(DKIM_SIGNHEADER) + 2};
  unsigned char* buf = nullptr;
  size_t         len = 0;
  status_            = dkim_getsighdr_d(dkim_, initial, &buf, &len);
  if (status_ != DKIM_STAT_OK)
    throw SendError(
        fmt::format("dkim_getsighdr_d error: {}", dkim_getresultstr(status_)));
  return std::string(c(buf), len);
}

void check_key(DkimConfig const& config)
{
  std::unique_ptr<BIO, decltype(&BIO_free)> bio{
      BIO_new_mem_buf(config.private_key.data(),
                      static_cast<int>(config.private_key.size())),
      BIO_free};
  if (!bio)
    throw ConfigurationError("DKIM private key: BIO_new_mem_buf failed");

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey{
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr),
      EVP_PKEY_free};
  if (!pkey)
    throw ConfigurationError(fmt::format(
        "DKIM private key for {} is not a PEM private key", config.domain));

  if (EVP_PKEY_base_id(pkey.get()) != EVP_PKEY_RSA)
    throw ConfigurationError(
        fmt::format("DKIM private key for {} is not RSA", config.domain));

  try {
    sign_message(config, "From: check@example.com\r\n"
                         "To: check@example.com\r\n"
                         "Subject: key check\r\n"
                         "\r\n"
                         "key check\r\n");
  }
  catch (SendError const& e) {
    throw ConfigurationError(
        fmt::format("DKIM key for {} can't sign: {}", config.domain, e.what()));
  }
}

std::string sign_message(DkimConfig const& config, std::string_view message)
{
  Signer signer(config.private_key, config.selector, config.domain);
  feed(signer, message);
  return fmt::format("{}: {}", DKIM_SIGNHEADER, signer.getsighdr());
}

} // namespace DKIM
