#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace jobq::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 v4 UUIDs. Used for generated worker identities.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// "worker-" followed by the first 8 hex digits of a fresh UUID.
std::string GenerateWorkerId();

} // namespace jobq::util
