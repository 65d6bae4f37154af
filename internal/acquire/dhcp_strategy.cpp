#include "dhcp_strategy.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/ip_address.hpp"

namespace labfleet::acquire {

namespace {

// Deliberately loose: the literal is validated after matching so that
// 999.1.2.3 is rejected instead of being cut down to 99.1.2.3.
constexpr std::string_view kDotted = "([0-9]+(?:\\.[0-9]+){3})";

std::string WithDotted(std::string_view prefix, std::string_view suffix = {}) {
  return std::string(prefix) + std::string(kDotted) + std::string(suffix);
}

class IpAddrStrategy : public ScrapeStrategy {
 public:
  IpAddrStrategy() : ScrapeStrategy("ip-addr", "ip -4 addr show dev {if}", WithDotted("\\binet\\s+", "/[0-9]+")) {
  }

 protected:
  bool Accept(std::string_view ip) const override {
    return ip.substr(0, 4) != "127.";
  }
};

} // namespace

ScrapeStrategy::ScrapeStrategy(std::string name, std::string command_template, const std::string& lease_pattern,
                               const std::string& gateway_pattern)
    : name_(std::move(name)), command_template_(std::move(command_template)), lease_(lease_pattern, std::regex::icase) {
  if (!gateway_pattern.empty()) {
    gateway_.emplace(gateway_pattern, std::regex::icase);
  }
}

std::string ScrapeStrategy::Command(std::string_view ifname) const {
  std::string out = command_template_;
  for (auto at = out.find("{if}"); at != std::string::npos; at = out.find("{if}", at + ifname.size())) {
    out.replace(at, 4, ifname);
  }
  return out;
}

bool ScrapeStrategy::Accept(std::string_view) const {
  return true;
}

std::optional<Lease> ScrapeStrategy::Parse(std::string_view output) const {
  const std::string text(output);

  std::optional<Lease> lease;
  for (std::sregex_iterator it(text.begin(), text.end(), lease_), end; it != end; ++it) {
    const std::string candidate = (*it)[1].str();
    if (util::IsValidIpv4(candidate) && Accept(candidate)) {
      lease = Lease{candidate, std::nullopt};
      break;
    }
  }
  if (!lease || !gateway_) return lease;

  for (std::sregex_iterator it(text.begin(), text.end(), *gateway_), end; it != end; ++it) {
    const std::string candidate = (*it)[1].str();
    if (util::IsValidIpv4(candidate)) {
      lease->gateway = candidate;
      break;
    }
  }
  return lease;
}

std::unique_ptr<DhcpStrategy> MakeStrategy(std::string_view name) {
  if (name == "dhclient") {
    return std::make_unique<ScrapeStrategy>("dhclient", "command -v dhclient >/dev/null 2>&1 && dhclient -v -1 {if}",
                                            WithDotted("\\bbound to\\s+"));
  }
  if (name == "udhcpc") {
    return std::make_unique<ScrapeStrategy>("udhcpc", "command -v udhcpc >/dev/null 2>&1 && udhcpc -i {if} -q -n -t 3",
                                            WithDotted("\\blease of\\s+", "\\s+obtained"),
                                            WithDotted("\\b(?:router|default gw|via)\\s+"));
  }
  if (name == "dhcpcd") {
    return std::make_unique<ScrapeStrategy>("dhcpcd", "command -v dhcpcd >/dev/null 2>&1 && dhcpcd -4 -t 10 {if}",
                                            WithDotted("\\bleased\\s+"), WithDotted("\\bdefault route via\\s+"));
  }
  if (name == "ip-addr") {
    return std::make_unique<IpAddrStrategy>();
  }
  throw util::InvalidArgument("unknown DHCP strategy '" + std::string(name) + "'");
}

std::vector<std::unique_ptr<DhcpStrategy>> MakeStrategies(const std::vector<std::string>& names) {
  std::vector<std::unique_ptr<DhcpStrategy>> strategies;
  strategies.reserve(names.size());
  for (const auto& name : names) {
    strategies.push_back(MakeStrategy(name));
  }
  return strategies;
}

} // namespace labfleet::acquire
