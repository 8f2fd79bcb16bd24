#include "core/Splitter.hpp"

namespace chunkgate::core {

std::vector<ByteSpan> splitContent(ByteSpan content, std::size_t parts) {
    std::vector<ByteSpan> result;
    if (parts == 0) {
        return result;
    }

    const auto partSize = content.size() / parts;
    result.reserve(parts);
    for (std::size_t i = 0; i < parts; ++i) {
        const auto offset = i * partSize;
        if (i == parts - 1) {
            result.push_back(content.subspan(offset));
        } else {
            result.push_back(content.subspan(offset, partSize));
        }
    }
    return result;
}

}  // namespace chunkgate::core
