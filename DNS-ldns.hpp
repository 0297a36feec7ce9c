#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <chrono>
#include <string>

#include "DNS.hpp"

// forward decl
typedef struct ldns_struct_pkt      ldns_pkt;
typedef struct ldns_struct_rdf      ldns_rdf;
typedef struct ldns_struct_resolver ldns_resolver;

namespace Config {
constexpr auto dns_timeout_default = std::chrono::milliseconds(5'000);
} // namespace Config

namespace DNS_ldns {

class Domain {
public:
  Domain(Domain const&) = delete;
  Domain& operator=(Domain const&) = delete;

  explicit Domain(std::string const& domain);
  ~Domain();

  std::string const& str() const { return str_; }
  ldns_rdf*          get() const { return rdfp_; }

private:
  std::string str_;
  ldns_rdf*   rdfp_;
};

// Resolver state loaded from /etc/resolv.conf, one per lookup, so any
// number of lookups may be in flight on different threads.
class Session {
public:
  Session(Session const&) = delete;
  Session& operator=(Session const&) = delete;

  explicit Session(std::chrono::milliseconds timeout);
  ~Session();

  ldns_resolver* get() const { return res_; }

private:
  ldns_resolver* res_{nullptr};
};

class Query {
public:
  Query(Query const&) = delete;
  Query& operator=(Query const&) = delete;

  Query(Session const& res, DNS::RR_type type, std::string const& dom);
  ~Query();

  bool bogus_or_indeterminate() const { return bogus_or_indeterminate_; }
  bool nx_domain() const { return nx_domain_; }

  std::string const& error() const { return error_; }

  DNS::RR_collection get_records() const;

private:
  ldns_pkt* p_{nullptr};

  std::string error_;

  bool bogus_or_indeterminate_{false};
  bool nx_domain_{false};
};

// --dns_timeout_ms, or DELIVERD_DNS_TIMEOUT_MS when set.
std::chrono::milliseconds configured_timeout();

class Resolver : public DNS::Resolver {
public:
  explicit Resolver(std::chrono::milliseconds timeout
                    = Config::dns_timeout_default);

  DNS::Answer query(DNS::RR_type type, std::string const& name) override;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP
