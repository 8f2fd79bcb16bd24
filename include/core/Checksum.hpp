#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkgate::core {

// Lowercase hex SHA-256 of the buffer. Throws std::runtime_error if the digest
// context cannot be set up.
std::string sha256Hex(const std::uint8_t *data, std::size_t size);

}  // namespace chunkgate::core
