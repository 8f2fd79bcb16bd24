#include "backends/MemoryBackend.hpp"

#include <drogon/drogon.h>

#include <utility>

namespace chunkgate::backends {

MemoryBackend::MemoryBackend(std::string name, std::string address)
    : name_(std::move(name)), address_(std::move(address)) {}

MemoryBackend::~MemoryBackend() = default;

Result<SaveAck> MemoryBackend::saveChunk(const std::string &name, std::uint32_t order, const std::uint8_t *data,
                                         std::size_t size) {
    LOG_DEBUG << "Storing resource " << name << " chunk order " << order << " on backend " << name_ << " ("
              << address_ << ")";

    Chunk chunk;
    chunk.order = order;
    if (size > 0) {
        chunk.data.assign(data, data + size);
    }

    {
        std::lock_guard guard(mutex_);
        storage_[name] = std::move(chunk);
    }

    Result<SaveAck> result;
    result.data = SaveAck{size};
    return result;
}

Result<Chunk> MemoryBackend::getChunk(const std::string &name) {
    LOG_DEBUG << "Getting resource " << name << " from backend " << name_ << " (" << address_ << ")";

    Result<Chunk> result;
    std::lock_guard guard(mutex_);
    auto it = storage_.find(name);
    if (it == storage_.end()) {
        result.error = makeError("not_found", "chunk_not_found", "resource \"" + name + "\" not found", name_);
        return result;
    }
    result.data = it->second;
    return result;
}

std::size_t MemoryBackend::storedCount() const {
    std::lock_guard guard(mutex_);
    return storage_.size();
}

}  // namespace chunkgate::backends
