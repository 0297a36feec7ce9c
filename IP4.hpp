#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include <string>
#include <string_view>

namespace IP4 {
auto is_address(std::string_view addr) -> bool;

// "a.b.c.d" to "d.c.b.a", the DNSBL query label order.
auto reverse(std::string_view addr) -> std::string;

// 127.0.0.0/8, the range DNSBL zones answer from.
auto is_loopback_net(std::string_view addr) -> bool;

// 127.255.255.0/24, Spamhaus style "query refused" return codes.
auto is_dnsbl_refusal(std::string_view addr) -> bool;
} // namespace IP4

#endif // IP4_DOT_HPP
