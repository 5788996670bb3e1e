#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace fleet::util {

/*
  UUID helpers

  Worker names carry a random RFC4122 v4 suffix so that replacements never
  collide with a runner the provider still remembers.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// First eight hex characters of a fresh UUID.
std::string ShortId();

} // namespace fleet::util
