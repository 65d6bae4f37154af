#pragma once

#include <string_view>

#include "internal/model/node.hpp"

namespace labfleet::classify {

/*
  Maps a node name to its role by case-insensitive substring match.

  Priority: switch (switch/openvswitch/ovs) > dhcp-server (dhcp/dnsmasq) >
  firewall > client. Advisory only, used to select a workflow.
*/
model::NodeRole Classify(std::string_view node_name);

} // namespace labfleet::classify
