#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace komorebi::util {

/*
  UUID helpers

  Random RFC4122 version 4 UUIDs, used as default qualifiers.
*/

using UUID = std::array<uint8_t, 16>;

// Throws EntropyUnavailable when the per-thread engine cannot be seeded.
UUID GenerateUUID();

// 32 lowercase hex characters, no separators.
std::string ToHex(const UUID& id);

} // namespace komorebi::util
