#include "core/UploadOrchestrator.hpp"

#include "core/Checksum.hpp"
#include "core/Metrics.hpp"

#include "chunkgate/logging.h"

#include <drogon/drogon.h>
#include <drogon/utils/Utilities.h>

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

namespace chunkgate::core {

std::string generateResourceId() {
    return drogon::utils::getUuid();
}

UploadOrchestrator::UploadOrchestrator(backends::BackendList backends,
                                       ChunkRegistry &registry,
                                       ResourceIdGenerator idGenerator)
    : backends_(std::move(backends)), registry_(registry), idGenerator_(std::move(idGenerator)) {}

backends::Result<UploadReceipt> UploadOrchestrator::upload(const std::string &fileName, ByteSpan content) {
    backends::Result<UploadReceipt> result;

    if (backends_.empty()) {
        result.error = backends::makeError("internal_error", "no_backends", "No storage backends are configured.");
        return result;
    }

    std::string checksum;
    try {
        checksum = sha256Hex(content.data(), content.size());
    } catch (const std::exception &ex) {
        result.error = backends::makeError("internal_error", "checksum_failed", ex.what());
        return result;
    }

    const auto resourceId = idGenerator_();
    const auto parts = splitContent(content, backends_.size());

    registry_.createEmpty(resourceId, parts.size());

    // Writer threads log under the caller's request context.
    auto taskContext = currentLogContext();
    taskContext.resourceId = resourceId;

    std::atomic<bool> aborted{false};
    std::mutex errorMutex;
    std::optional<backends::Error> firstError;

    auto recordFailure = [&](backends::Error error) {
        std::lock_guard guard(errorMutex);
        if (!firstError.has_value()) {
            firstError = std::move(error);
        }
        aborted.store(true, std::memory_order_release);
    };

    std::vector<std::future<void>> tasks;
    tasks.reserve(parts.size());
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto order = static_cast<std::uint32_t>(i);
        try {
            tasks.push_back(std::async(std::launch::async, [&, order]() {
                setLogContext(taskContext);
                if (aborted.load(std::memory_order_acquire)) {
                    return;
                }
                if (auto error = writePart(resourceId, fileName, order, parts[order]); error.has_value()) {
                    recordFailure(std::move(*error));
                }
            }));
        } catch (const std::system_error &ex) {
            recordFailure(backends::makeError("internal_error", "spawn_failed",
                                              "failed to start writer for part " + std::to_string(order) + ": " +
                                                  ex.what()));
            break;
        }
    }

    for (auto &task : tasks) {
        try {
            task.get();
        } catch (const std::exception &ex) {
            recordFailure(backends::makeError("internal_error", "writer_failed", ex.what()));
        }
    }

    if (firstError.has_value()) {
        LOG_ERROR << "Upload of " << fileName << " as " << resourceId << " failed: " << firstError->message;
        MetricsRegistry::instance().recordUpload(false);
        result.error = std::move(firstError);
        return result;
    }

    registry_.commit(resourceId);
    MetricsRegistry::instance().recordUpload(true);

    LOG_INFO << "File uploaded successfully: file_name=" << fileName << " checksum=" << checksum
             << " resource_id=" << resourceId;

    UploadReceipt receipt;
    receipt.resourceId = resourceId;
    receipt.checksum = std::move(checksum);
    receipt.size = content.size();
    receipt.chunks = parts.size();
    result.data = std::move(receipt);
    return result;
}

std::optional<backends::Error> UploadOrchestrator::writePart(const std::string &resourceId,
                                                             const std::string &fileName,
                                                             std::uint32_t order,
                                                             ByteSpan part) {
    const auto &backend = backendFor(order);

    LOG_DEBUG << "Sending part " << fileName << "-part-" << order << " to backend " << backend->name();

    auto saved = backend->saveChunk(resourceId, order, part.data(), part.size());
    MetricsRegistry::instance().recordChunk(backend->name(), ChunkOperation::Save, part.size(), saved.ok());
    if (!saved.ok()) {
        auto error = *saved.error;
        error.message = "failed to upload part " + std::to_string(order) + " to backend " + backend->name() +
                        ": " + error.message;
        return error;
    }

    ChunkLocation location;
    location.resourceId = resourceId;
    location.fileName = fileName;
    location.order = order;
    location.backendRef = backend->address();
    registry_.append(resourceId, std::move(location));
    return std::nullopt;
}

// Chunk order doubles as the backend index; one part per backend.
const std::shared_ptr<backends::IBackend> &UploadOrchestrator::backendFor(std::uint32_t order) const {
    return backends_.at(order);
}

}  // namespace chunkgate::core
