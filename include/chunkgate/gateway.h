#pragma once

#include "backends/IBackend.hpp"
#include "core/ChunkRegistry.hpp"
#include "core/DownloadOrchestrator.hpp"
#include "core/UploadOrchestrator.hpp"

namespace chunkgate {

// Everything one gateway process shares across requests.
struct Gateway {
    explicit Gateway(backends::BackendList backendList,
                     core::ResourceIdGenerator idGenerator = core::generateResourceId);

    Gateway(const Gateway &) = delete;
    Gateway &operator=(const Gateway &) = delete;

    backends::BackendList backends;
    core::ChunkRegistry registry;
    core::UploadOrchestrator uploader;
    core::DownloadOrchestrator downloader;
};

}  // namespace chunkgate
