#include "DNS.hpp"

namespace DNS {

std::vector<std::string> txt_containing(Answer const&      answer,
                                        std::string const& tag)
{
  std::vector<std::string> ret;
  for (auto const& rr : answer.rrs) {
    if (std::holds_alternative<RR_TXT>(rr)) {
      auto const& txt = std::get<RR_TXT>(rr).str();
      if (txt.find(tag) != std::string::npos)
        ret.push_back(txt);
    }
  }
  return ret;
}

} // namespace DNS
