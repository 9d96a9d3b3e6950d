#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <span>

namespace common {

// Lowercase hex SHA-256 of the given bytes.
std::string sha256Hex(std::span<const std::uint8_t> data);
std::string sha256Hex(std::string_view data);

} // namespace common
