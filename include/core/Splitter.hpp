#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace chunkgate::core {

using ByteSpan = std::span<const std::uint8_t>;

// Partitions `content` into exactly `parts` contiguous views. Every part but the
// last holds size/parts bytes; the last one takes the remainder. Leading parts
// are empty when size < parts. The views alias `content`.
std::vector<ByteSpan> splitContent(ByteSpan content, std::size_t parts);

}  // namespace chunkgate::core
