#ifndef DNS_FAKE_DOT_HPP
#define DNS_FAKE_DOT_HPP

// Canned answers for tests; anything not added is NXDOMAIN.

#include "DNS.hpp"
#include "Errors.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>

#include <arpa/inet.h>

#include <glog/logging.h>

namespace DNS {

class Fake_resolver : public Resolver {
public:
  // Not thread safe; fill before the first query().
  void add_txt(std::string const& name, std::string txt)
  {
    answers_[{RR_type::TXT, name}].rrs.emplace_back(RR_TXT{std::move(txt)});
  }
  void add_mx(std::string const& name, std::string exchange, uint16_t pref)
  {
    answers_[{RR_type::MX, name}].rrs.emplace_back(
        RR_MX{std::move(exchange), pref});
  }
  void add_a(std::string const& name, char const* addr)
  {
    in_addr a{};
    CHECK_EQ(inet_pton(AF_INET, addr, &a), 1) << addr;
    answers_[{RR_type::A, name}].rrs.emplace_back(
        RR_A{reinterpret_cast<uint8_t const*>(&a), sizeof a});
  }
  void fail(RR_type type, std::string const& name)
  {
    auto& answer                  = answers_[{type, name}];
    answer.bogus_or_indeterminate = true;
    answer.error                  = "server failure";
  }
  void unreachable(std::string const& name) { unreachable_.insert(name); }

  Answer query(RR_type type, std::string const& name) override
  {
    ++queries_;
    if (unreachable_.count(name))
      throw DnsLookupError(name + ": no nameserver reachable");

    auto const it = answers_.find({type, name});
    if (it != answers_.end())
      return it->second;

    Answer nx;
    nx.nx_domain = true;
    return nx;
  }

  int queries() const { return queries_; }

private:
  std::map<std::pair<RR_type, std::string>, Answer> answers_;
  std::set<std::string>                             unreachable_;
  std::atomic<int>                                  queries_{0};
};

} // namespace DNS

#endif // DNS_FAKE_DOT_HPP
