#include "core/DownloadOrchestrator.hpp"

#include "core/Metrics.hpp"

#include <drogon/drogon.h>

#include <utility>

namespace chunkgate::core {

DownloadOrchestrator::DownloadOrchestrator(backends::BackendList backends, const ChunkRegistry &registry)
    : backends_(std::move(backends)), registry_(registry) {}

backends::Result<DownloadedFile> DownloadOrchestrator::download(const std::string &resourceId) const {
    backends::Result<DownloadedFile> result;

    if (resourceId.empty()) {
        result.error = backends::makeError("validation_error", "missing_resource_id", "Resource ID is required");
        return result;
    }

    auto entry = registry_.get(resourceId);
    if (!entry.has_value() || !entry->committed || entry->chunks.empty()) {
        result.error = backends::makeError("not_found", "resource_not_found", "File not found");
        return result;
    }

    DownloadedFile file;
    file.resourceId = resourceId;
    file.fileName = entry->chunks.front().fileName;

    for (const auto &location : entry->chunks) {
        if (location.order >= backends_.size()) {
            result.error = backends::makeError("internal_error", "backend_out_of_range",
                                               "chunk " + std::to_string(location.order) +
                                                   " refers to an unknown backend");
            return result;
        }

        const auto &backend = backends_[location.order];
        LOG_DEBUG << "Downloading file chunk: resource_id=" << resourceId << " order=" << location.order
                  << " backend=" << location.backendRef;

        auto fetched = backend->getChunk(resourceId);
        const auto fetchedBytes = fetched.ok() ? fetched.data->data.size() : 0;
        MetricsRegistry::instance().recordChunk(backend->name(), ChunkOperation::Fetch, fetchedBytes, fetched.ok());
        if (!fetched.ok()) {
            auto error = *fetched.error;
            LOG_ERROR << "Failed to get chunk " << location.order << " of " << resourceId << " from "
                      << backend->name() << ": " << error.message;
            // A chunk missing from a backend after commit is a storage fault, not a
            // client error.
            if (error.type == "not_found") {
                error.type = "backend_error";
            }
            result.error = std::move(error);
            return result;
        }

        const auto &data = fetched.data->data;
        file.content.insert(file.content.end(), data.begin(), data.end());
    }

    LOG_INFO << "File downloaded successfully: resource_id=" << resourceId << " content_length="
             << file.content.size();

    result.data = std::move(file);
    return result;
}

}  // namespace chunkgate::core
