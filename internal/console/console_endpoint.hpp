#pragma once

#include <string>
#include <string_view>

#include "internal/console/console_session.hpp"
#include "internal/model/node.hpp"

namespace labfleet::console {

// Reduces "http://user@host:port/path", "[::1]:5000" or "host:5000" to the
// bare host. Empty and wildcard bind addresses normalize to "".
std::string NormalizeHost(std::string_view raw);

/*
  Picks the console endpoint for one node.

  A non-empty override wins for every node. Otherwise the stored host is used,
  falling back to 127.0.0.1 when it is empty or a wildcard. Throws
  util::ConnectError when the node has no console port.
*/
ConsoleEndpoint ResolveEndpoint(const model::Node& node, std::string_view host_override);

} // namespace labfleet::console
