#pragma once

#include "backends/IBackend.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkgate::backends {

class MemoryBackend : public IBackend {
   public:
    MemoryBackend(std::string name, std::string address);
    ~MemoryBackend() override;

    Result<SaveAck> saveChunk(const std::string &name, std::uint32_t order, const std::uint8_t *data,
                              std::size_t size) override;
    Result<Chunk> getChunk(const std::string &name) override;

    [[nodiscard]] const std::string &name() const override { return name_; }
    [[nodiscard]] const std::string &address() const override { return address_; }

    std::size_t storedCount() const;

   private:
    std::string name_;
    std::string address_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Chunk> storage_;
};

}  // namespace chunkgate::backends
