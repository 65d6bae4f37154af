#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace labfleet::acquire {

struct Lease {
  std::string                ip;
  std::optional<std::string> gateway;
};

/*
  One DHCP client flavour: the command that runs it and the matcher that
  scrapes a lease out of its console output.

  Parse only accepts well-formed IPv4 literals attached to the client's own
  lease marker; anything else (including a "not found" shell) is nullopt.
*/
class DhcpStrategy {
 public:
  virtual ~DhcpStrategy() = default;

  virtual std::string_view     name() const                            = 0;
  virtual std::string          Command(std::string_view ifname) const  = 0;
  virtual std::optional<Lease> Parse(std::string_view output) const    = 0;
};

/*
  Strategy driven by two patterns: the lease marker (group 1 is the address)
  and an optional gateway marker (group 1 is the gateway).
*/
class ScrapeStrategy : public DhcpStrategy {
 public:
  ScrapeStrategy(std::string name, std::string command_template, const std::string& lease_pattern,
                 const std::string& gateway_pattern = {});

  std::string_view name() const override {
    return name_;
  }

  // "{if}" in the template is replaced by the interface name.
  std::string          Command(std::string_view ifname) const override;
  std::optional<Lease> Parse(std::string_view output) const override;

 protected:
  // Hook for strategies that must skip otherwise valid addresses.
  virtual bool Accept(std::string_view ip) const;

 private:
  std::string               name_;
  std::string               command_template_;
  std::regex                lease_;
  std::optional<std::regex> gateway_;
};

// Names: dhclient, udhcpc, dhcpcd, ip-addr. Throws util::InvalidArgument otherwise.
std::unique_ptr<DhcpStrategy> MakeStrategy(std::string_view name);

std::vector<std::unique_ptr<DhcpStrategy>> MakeStrategies(const std::vector<std::string>& names);

} // namespace labfleet::acquire
