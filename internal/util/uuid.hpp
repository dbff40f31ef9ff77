#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace shopstack::util {

/*
  UUID helpers

  Pipeline execution ids are RFC4122 v4 UUIDs in their canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewExecutionId();

} // namespace shopstack::util
