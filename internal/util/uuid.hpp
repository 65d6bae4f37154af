#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace labfleet::util {

/*
  UUID helpers

  Used to mint end-of-command sentinels that cannot collide with anything a
  node prints on its own.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// 32 lowercase hex characters, no dashes.
std::string GenerateToken();

} // namespace labfleet::util
