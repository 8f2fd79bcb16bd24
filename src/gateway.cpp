#include "chunkgate/gateway.h"

#include <utility>

namespace chunkgate {

Gateway::Gateway(backends::BackendList backendList, core::ResourceIdGenerator idGenerator)
    : backends(std::move(backendList)),
      uploader(backends, registry, std::move(idGenerator)),
      downloader(backends, registry) {}

}  // namespace chunkgate
