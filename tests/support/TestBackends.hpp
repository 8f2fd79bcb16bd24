#pragma once

#include "backends/IBackend.hpp"
#include "backends/MemoryBackend.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkgate::testing {

// Memory backend that counts calls and can be told to fail.
class ScriptedBackend : public backends::IBackend {
   public:
    explicit ScriptedBackend(std::string name)
        : name_(std::move(name)), address_("memory://" + name_), store_(name_, address_) {}

    backends::Result<backends::SaveAck> saveChunk(const std::string &name, std::uint32_t order,
                                                  const std::uint8_t *data, std::size_t size) override {
        ++saveCalls;
        if (failSaves.load()) {
            backends::Result<backends::SaveAck> result;
            result.error = backends::makeError("backend_error", "500", "failed to store on " + name_, name_);
            return result;
        }
        return store_.saveChunk(name, order, data, size);
    }

    backends::Result<backends::Chunk> getChunk(const std::string &name) override {
        ++getCalls;
        if (failGets.load()) {
            backends::Result<backends::Chunk> result;
            result.error = backends::makeError("network_error", "network_error", "connection reset", name_);
            return result;
        }
        return store_.getChunk(name);
    }

    [[nodiscard]] const std::string &name() const override { return name_; }
    [[nodiscard]] const std::string &address() const override { return address_; }

    std::size_t storedCount() const { return store_.storedCount(); }

    std::atomic<bool> failSaves{false};
    std::atomic<bool> failGets{false};
    std::atomic<int> saveCalls{0};
    std::atomic<int> getCalls{0};

   private:
    std::string name_;
    std::string address_;
    backends::MemoryBackend store_;
};

inline std::vector<std::shared_ptr<ScriptedBackend>> makeScriptedBackends(std::size_t count) {
    std::vector<std::shared_ptr<ScriptedBackend>> result;
    for (std::size_t i = 0; i < count; ++i) {
        result.push_back(std::make_shared<ScriptedBackend>("backend-" + std::to_string(i)));
    }
    return result;
}

inline backends::BackendList asBackendList(const std::vector<std::shared_ptr<ScriptedBackend>> &scripted) {
    return backends::BackendList(scripted.begin(), scripted.end());
}

inline backends::Bytes patternedBytes(std::size_t size, std::uint8_t seed = 0) {
    backends::Bytes bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xffu);
    }
    return bytes;
}

}  // namespace chunkgate::testing
