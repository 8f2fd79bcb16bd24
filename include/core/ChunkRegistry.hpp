#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkgate::core {

struct ChunkLocation {
    std::string resourceId;
    std::string fileName;
    std::uint32_t order{0};
    std::string backendRef;
};

struct RegistryEntry {
    std::vector<ChunkLocation> chunks;
    bool committed{false};
};

// Process-wide directory of uploaded resources. A single mutex serializes every
// operation; entries are never removed.
class ChunkRegistry {
  public:
    ChunkRegistry() = default;
    ChunkRegistry(const ChunkRegistry &) = delete;
    ChunkRegistry &operator=(const ChunkRegistry &) = delete;

    void createEmpty(const std::string &resourceId, std::size_t expectedChunks = 0);
    void append(const std::string &resourceId, ChunkLocation location);

    // Sorts the chunk list by order and makes the entry visible to readers.
    // Returns false when the resource was never created.
    bool commit(const std::string &resourceId);

    std::optional<RegistryEntry> get(const std::string &resourceId) const;
    std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RegistryEntry> entries_;
};

}  // namespace chunkgate::core
