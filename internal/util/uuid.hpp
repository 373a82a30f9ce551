#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace medsync::util {

/*
  UUID helpers

  Transfer ids are RFC4122 version 4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewTransferId();

} // namespace medsync::util
