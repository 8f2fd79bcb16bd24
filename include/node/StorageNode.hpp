#pragma once

#include "backends/IBackend.hpp"
#include "backends/MemoryBackend.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace drogon {
class HttpAppFramework;
}  // namespace drogon

namespace chunkgate::node {

struct SaveChunkRequest {
    std::string name;
    std::uint32_t order{0};
    std::size_t size{0};
};

// Validates the query parameters of a save-chunk call against the received
// body. `size` may be omitted; when present it must equal `bodyLength`.
backends::Result<SaveChunkRequest> parseSaveChunkRequest(const std::string &name,
                                                         const std::string &order,
                                                         const std::string &size,
                                                         std::size_t bodyLength);

// Serves POST /save-chunk and GET /get-chunk on top of an in-memory store.
void registerNodeRoutes(drogon::HttpAppFramework &app, std::shared_ptr<backends::MemoryBackend> store);

}  // namespace chunkgate::node
