#include "DNS-ldns.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <cstdlib>

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <gflags/gflags.h>

DEFINE_uint64(dns_timeout_ms,
              Config::dns_timeout_default.count(),
              "DNS query timeout in milliseconds");

#include <glog/logging.h>

#include <fmt/format.h>

namespace DNS_ldns {

namespace {
std::string rr_name_str(ldns_rdf const* rdf)
{
  auto const sz = ldns_rdf_size(rdf);

  if (sz > LDNS_MAX_DOMAINLEN) {
    LOG(WARNING) << "rdf size too large";
    return "<too long>";
  }
  if (sz == 1) {
    return ""; // root label
  }

  auto const data = ldns_rdf_data(rdf);

  size_t        src_pos = 0;
  unsigned char len     = data[src_pos];

  std::string str;
  str.reserve(64);
  while ((len > 0) && (src_pos < sz)) {
    src_pos++;
    for (unsigned char i = 0; (i < len) && (src_pos < sz); ++i) {
      unsigned char c = data[src_pos];
      if (c == '.' || c == '\\') {
        str += '\\';
      }
      str += c;
      src_pos++;
    }
    if (src_pos < sz) {
      str += '.';
      len = data[src_pos];
    }
    else {
      len = 0;
    }
  }

  if (str.length() && ('.' == str.back())) {
    str.erase(str.length() - 1);
  }

  return str;
}

// One <character-string>: a length octet followed by that many octets.
std::string rr_str(ldns_rdf const* rdf)
{
  auto const sz = ldns_rdf_size(rdf);
  if (sz == 0)
    return "";

  auto const udata = ldns_rdf_data(rdf);
  auto const len   = std::min<size_t>(udata[0], sz - 1);

  return std::string(reinterpret_cast<char const*>(udata + 1), len);
}
} // namespace

Domain::Domain(std::string const& domain)
  : str_(domain)
  , rdfp_(ldns_dname_new_frm_str(domain.c_str()))
{
  if (rdfp_ == nullptr)
    throw DnsLookupError(fmt::format("invalid domain name «{}»", domain));
}

Domain::~Domain() { ldns_rdf_deep_free(rdfp_); }

Session::Session(std::chrono::milliseconds timeout)
{
  auto const status = ldns_resolver_new_frm_file(&res_, nullptr);
  if (status != LDNS_STATUS_OK) {
    res_ = nullptr;
    throw DnsLookupError(fmt::format("failed to initialize DNS resolver: {}",
                                     ldns_get_errorstr_by_id(status)));
  }

  auto tv{timeval{}};
  tv.tv_sec  = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;
  ldns_resolver_set_timeout(res_, tv);
  ldns_resolver_set_retry(res_, 1);
}

Session::~Session()
{
  if (res_)
    ldns_resolver_deep_free(res_);
}

Query::Query(Session const& res, DNS::RR_type type, std::string const& domain)
{
  Domain dom(domain);

  ldns_status status = ldns_resolver_query_status(
      &p_, res.get(), dom.get(), static_cast<ldns_enum_rr_type>(type),
      LDNS_RR_CLASS_IN, LDNS_RD);

  if (status != LDNS_STATUS_OK) {
    bogus_or_indeterminate_ = true;
    error_                  = ldns_get_errorstr_by_id(status);
  }

  if (p_) {
    auto const rcode = ldns_pkt_get_rcode(p_);

    switch (rcode) {
    case LDNS_RCODE_NOERROR: break;

    case LDNS_RCODE_NXDOMAIN:
      nx_domain_              = true;
      bogus_or_indeterminate_ = false;
      error_.clear();
      break;

    case LDNS_RCODE_SERVFAIL:
      bogus_or_indeterminate_ = true;
      error_                  = DNS::rcode_c_str(rcode);
      break;

    default:
      bogus_or_indeterminate_ = true;
      error_                  = DNS::rcode_c_str(rcode);
      LOG(WARNING) << "DNS unknown error (" << dom.str() << "/"
                   << DNS::RR_type_c_str(type) << "), rcode = " << error_
                   << " (" << rcode << ")";
      break;
    }
  }
}

Query::~Query()
{
  if (p_)
    ldns_pkt_free(p_);
}

DNS::RR_collection Query::get_records() const
{
  DNS::RR_collection ret;

  if (p_ == nullptr)
    return ret;

  // no clones, so no frees required
  auto const rrlst = ldns_pkt_answer(p_);
  if (rrlst == nullptr)
    return ret;

  auto const count = ldns_rr_list_rr_count(rrlst);
  ret.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    auto const rr = ldns_rr_list_rr(rrlst, i);
    if (rr == nullptr)
      continue;

    switch (ldns_rr_get_type(rr)) {
    case LDNS_RR_TYPE_A: {
      auto const rdf = ldns_rr_rdf(rr, 0);
      if (rdf && ldns_rdf_get_type(rdf) == LDNS_RDF_TYPE_A)
        ret.emplace_back(DNS::RR_A{ldns_rdf_data(rdf), ldns_rdf_size(rdf)});
      break;
    }
    case LDNS_RR_TYPE_CNAME: {
      auto const rdf = ldns_rr_rdf(rr, 0);
      if (rdf && ldns_rdf_get_type(rdf) == LDNS_RDF_TYPE_DNAME)
        ret.emplace_back(DNS::RR_CNAME{rr_name_str(rdf)});
      break;
    }
    case LDNS_RR_TYPE_MX: {
      if (ldns_rr_rd_count(rr) != 2)
        break;
      auto const rdf_0 = ldns_rr_rdf(rr, 0);
      auto const rdf_1 = ldns_rr_rdf(rr, 1);
      if (ldns_rdf_get_type(rdf_0) == LDNS_RDF_TYPE_INT16
          && ldns_rdf_get_type(rdf_1) == LDNS_RDF_TYPE_DNAME) {
        ret.emplace_back(
            DNS::RR_MX{rr_name_str(rdf_1), ldns_rdf2native_int16(rdf_0)});
      }
      break;
    }
    case LDNS_RR_TYPE_TXT: {
      std::string txt;
      for (size_t j = 0; j < ldns_rr_rd_count(rr); ++j) {
        auto const rdf = ldns_rr_rdf(rr, j);
        if (rdf && ldns_rdf_get_type(rdf) == LDNS_RDF_TYPE_STR)
          txt += rr_str(rdf);
      }
      ret.emplace_back(DNS::RR_TXT{std::move(txt)});
      break;
    }
    case LDNS_RR_TYPE_AAAA: {
      auto const rdf = ldns_rr_rdf(rr, 0);
      if (rdf && ldns_rdf_get_type(rdf) == LDNS_RDF_TYPE_AAAA)
        ret.emplace_back(DNS::RR_AAAA{ldns_rdf_data(rdf), ldns_rdf_size(rdf)});
      break;
    }

    default:
      // CNAME chains bring along records of other types.
      break;
    }
  }

  return ret;
}

std::chrono::milliseconds configured_timeout()
{
  if (auto const env = getenv("DELIVERD_DNS_TIMEOUT_MS"); env != nullptr)
    return std::chrono::milliseconds(strtoull(env, nullptr, 10));
  return std::chrono::milliseconds(FLAGS_dns_timeout_ms);
}

Resolver::Resolver(std::chrono::milliseconds timeout)
  : timeout_(timeout)
{
}

DNS::Answer Resolver::query(DNS::RR_type type, std::string const& name)
{
  Session res(timeout_);
  Query   q(res, type, name);

  DNS::Answer answer;
  answer.rrs                    = q.get_records();
  answer.nx_domain              = q.nx_domain();
  answer.bogus_or_indeterminate = q.bogus_or_indeterminate();
  answer.error                  = q.error();
  return answer;
}

} // namespace DNS_ldns
