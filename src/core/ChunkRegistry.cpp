#include "core/ChunkRegistry.hpp"

#include <algorithm>
#include <utility>

namespace chunkgate::core {

void ChunkRegistry::createEmpty(const std::string &resourceId, std::size_t expectedChunks) {
    RegistryEntry entry;
    entry.chunks.reserve(expectedChunks);
    std::lock_guard guard(mutex_);
    entries_[resourceId] = std::move(entry);
}

void ChunkRegistry::append(const std::string &resourceId, ChunkLocation location) {
    std::lock_guard guard(mutex_);
    entries_[resourceId].chunks.push_back(std::move(location));
}

bool ChunkRegistry::commit(const std::string &resourceId) {
    std::lock_guard guard(mutex_);
    auto it = entries_.find(resourceId);
    if (it == entries_.end()) {
        return false;
    }
    auto &chunks = it->second.chunks;
    std::sort(chunks.begin(), chunks.end(), [](const ChunkLocation &lhs, const ChunkLocation &rhs) {
        return lhs.order < rhs.order;
    });
    it->second.committed = true;
    return true;
}

std::optional<RegistryEntry> ChunkRegistry::get(const std::string &resourceId) const {
    std::lock_guard guard(mutex_);
    auto it = entries_.find(resourceId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ChunkRegistry::size() const {
    std::lock_guard guard(mutex_);
    return entries_.size();
}

}  // namespace chunkgate::core
