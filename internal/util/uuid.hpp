#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace handoff::util {

/*
  UUID helpers

  Entity ids travel as canonical 36 character RFC4122 strings.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// New random v4 id in canonical string form.
std::string NewId();

bool IsValidUuid(const std::string& str);

// Throws InvalidArgument naming `field` when `value` is not a UUID.
void RequireUuid(const std::string& value, const char* field);

} // namespace handoff::util
