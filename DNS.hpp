#ifndef DNS_DOT_HPP
#define DNS_DOT_HPP

#include "DNS-rrs.hpp"

#include <string>
#include <vector>

namespace DNS {

// Everything one question produced, including how it failed.
struct Answer {
  RR_collection rrs;

  bool nx_domain{false};
  bool bogus_or_indeterminate{false};

  std::string error; // set when bogus_or_indeterminate

  bool has_records() const { return !rrs.empty(); }
};

// Synchronous resolver interface; an implementation must allow
// concurrent query() calls from different threads.
class Resolver {
public:
  virtual ~Resolver() = default;

  // May throw DnsLookupError when no question could be sent at all.
  virtual Answer query(RR_type type, std::string const& name) = 0;
};

// TXT strings in answer that carry the given tag, e.g. "v=spf1".
std::vector<std::string> txt_containing(Answer const&      answer,
                                        std::string const& tag);

} // namespace DNS

#endif // DNS_DOT_HPP
