#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace eafkit::util {

/*
  UUID helpers

  Used to tag annotations with collision free ids before documents
  are merged. Raw 16 byte RFC4122 version 4 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical string form of a fresh UUID.
std::string GenerateUUIDString();

} // namespace eafkit::util
