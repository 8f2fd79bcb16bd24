#pragma once

#include "backends/IBackend.hpp"
#include "core/ChunkRegistry.hpp"
#include "core/Splitter.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace chunkgate::core {

struct UploadReceipt {
    std::string resourceId;
    std::string checksum;
    std::size_t size{0};
    std::size_t chunks{0};
};

using ResourceIdGenerator = std::function<std::string()>;

std::string generateResourceId();

// Splits a file across every configured backend, one concurrent writer per part.
//
// The registry entry is created before any writer starts and only committed once
// every part was accepted. A failed upload leaves the chunks that did land (and
// their records) in place; the entry stays uncommitted so it is never served.
class UploadOrchestrator {
  public:
    UploadOrchestrator(backends::BackendList backends,
                       ChunkRegistry &registry,
                       ResourceIdGenerator idGenerator = generateResourceId);

    backends::Result<UploadReceipt> upload(const std::string &fileName, ByteSpan content);

    [[nodiscard]] std::size_t backendCount() const { return backends_.size(); }

  private:
    std::optional<backends::Error> writePart(const std::string &resourceId,
                                             const std::string &fileName,
                                             std::uint32_t order,
                                             ByteSpan part);

    const std::shared_ptr<backends::IBackend> &backendFor(std::uint32_t order) const;

    backends::BackendList backends_;
    ChunkRegistry &registry_;
    ResourceIdGenerator idGenerator_;
};

}  // namespace chunkgate::core
