#pragma once

#include "backends/IBackend.hpp"
#include "core/ChunkRegistry.hpp"

#include <string>

namespace chunkgate::core {

struct DownloadedFile {
    std::string resourceId;
    std::string fileName;
    backends::Bytes content;
};

class DownloadOrchestrator {
  public:
    DownloadOrchestrator(backends::BackendList backends, const ChunkRegistry &registry);

    // Fetches every chunk of a committed resource in ascending order, one at a
    // time. Any failed fetch fails the whole download.
    backends::Result<DownloadedFile> download(const std::string &resourceId) const;

  private:
    backends::BackendList backends_;
    const ChunkRegistry &registry_;
};

}  // namespace chunkgate::core
