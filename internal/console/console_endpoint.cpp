#include "console_endpoint.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace labfleet::console {

namespace {

constexpr std::string_view kLoopback = "127.0.0.1";

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool IsWildcard(std::string_view host) {
  return host == "0.0.0.0" || host == "::" || host == "[::]";
}

} // namespace

std::string NormalizeHost(std::string_view raw) {
  std::string_view host = Trim(raw);

  if (auto scheme = host.find("//"); scheme != std::string_view::npos) {
    host.remove_prefix(scheme + 2);
  }
  if (auto slash = host.find('/'); slash != std::string_view::npos) {
    host = host.substr(0, slash);
  }
  if (auto at = host.rfind('@'); at != std::string_view::npos) {
    host.remove_prefix(at + 1);
  }

  if (!host.empty() && host.front() == '[') {
    auto close = host.find(']');
    host = close == std::string_view::npos ? host.substr(1) : host.substr(1, close - 1);
  } else if (std::count(host.begin(), host.end(), ':') == 1) {
    host = host.substr(0, host.find(':'));
  }

  host = Trim(host);
  if (host.empty() || IsWildcard(host)) return {};
  return std::string(host);
}

ConsoleEndpoint ResolveEndpoint(const model::Node& node, std::string_view host_override) {
  if (node.console_port == 0) {
    throw util::ConnectError("node " + node.name + " has no console port");
  }

  ConsoleEndpoint endpoint;
  endpoint.port = node.console_port;

  for (std::string_view candidate : {host_override, std::string_view(node.console_host), kLoopback}) {
    endpoint.host = NormalizeHost(candidate);
    if (!endpoint.host.empty()) break;
  }
  return endpoint;
}

} // namespace labfleet::console
