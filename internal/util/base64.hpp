#pragma once

#include <string>
#include <string_view>

namespace labfleet::util {

// RFC 4648 standard alphabet with '=' padding. Output never contains quotes
// or whitespace, so it is safe inside a single-quoted shell word.
std::string Base64Encode(std::string_view data);

} // namespace labfleet::util
