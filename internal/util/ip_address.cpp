#include "ip_address.hpp"

#include <arpa/inet.h>

#include <charconv>

namespace labfleet::util {

bool IsValidIpv4(std::string_view text) {
  int    octets = 0;
  size_t pos    = 0;

  while (true) {
    size_t end = text.find('.', pos);
    auto   part = text.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);

    if (part.empty() || part.size() > 3) return false;
    if (part.size() > 1 && part[0] == '0') return false;
    for (char c : part) {
      if (c < '0' || c > '9') return false;
    }

    int value = 0;
    std::from_chars(part.data(), part.data() + part.size(), value);
    if (value > 255) return false;

    ++octets;
    if (end == std::string_view::npos) break;
    pos = end + 1;
  }

  return octets == 4;
}

bool IsValidIpAddress(std::string_view text) {
  if (IsValidIpv4(text)) return true;
  if (text.find(':') == std::string_view::npos) return false;

  std::string copy(text);
  in6_addr    addr{};
  return inet_pton(AF_INET6, copy.c_str(), &addr) == 1;
}

std::optional<Cidr> ParseCidr(std::string_view text, std::uint32_t default_prefix) {
  Cidr cidr;
  auto slash = text.find('/');
  auto ip    = text.substr(0, slash);
  if (!IsValidIpv4(ip)) return std::nullopt;
  cidr.ip = std::string(ip);

  if (slash == std::string_view::npos) {
    cidr.prefix_length = default_prefix;
  } else {
    auto len = text.substr(slash + 1);
    if (len.empty() || len.size() > 2) return std::nullopt;

    std::uint32_t value = 0;
    auto [ptr, ec]      = std::from_chars(len.data(), len.data() + len.size(), value);
    if (ec != std::errc() || ptr != len.data() + len.size()) return std::nullopt;
    cidr.prefix_length = value;
  }

  if (cidr.prefix_length == 0 || cidr.prefix_length > 32) return std::nullopt;
  return cidr;
}

std::string FormatCidr(const Cidr& cidr) {
  return cidr.ip + "/" + std::to_string(cidr.prefix_length);
}

} // namespace labfleet::util
