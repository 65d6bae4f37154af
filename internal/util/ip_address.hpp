#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace labfleet::util {

// Dotted quad with every octet in 0..255 and no leading zeros.
bool IsValidIpv4(std::string_view text);

// IPv4 as above, or an IPv6 literal accepted by inet_pton.
bool IsValidIpAddress(std::string_view text);

struct Cidr {
  std::string   ip;
  std::uint32_t prefix_length = 0;
};

/*
  Parses "a.b.c.d/len" or a bare "a.b.c.d" (prefix_length left at
  `default_prefix`). Returns nullopt for anything malformed.
*/
std::optional<Cidr> ParseCidr(std::string_view text, std::uint32_t default_prefix);

std::string FormatCidr(const Cidr& cidr);

} // namespace labfleet::util
