#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace repricer::util {

/*
  UUID helpers

  Used for processing-instance identifiers (lock ownership) and
  audit entry ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// "<prefix>-<uuid>"
std::string GenerateId(const std::string& prefix);

} // namespace repricer::util
