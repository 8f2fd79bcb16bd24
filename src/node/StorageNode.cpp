#include "node/StorageNode.hpp"

#include <drogon/drogon.h>

#include <charconv>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <utility>

namespace chunkgate::node {
namespace {

using drogon::HttpRequestPtr;
using drogon::HttpResponse;
using drogon::HttpResponsePtr;

template <typename T>
bool parseNumber(const std::string &text, T &out) {
    if (text.empty()) {
        return false;
    }
    const auto *begin = text.data();
    const auto *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc{} && ptr == end;
}

HttpResponsePtr textResponse(drogon::HttpStatusCode status, const std::string &body) {
    auto response = HttpResponse::newHttpResponse();
    response->setStatusCode(status);
    response->setContentTypeCode(drogon::CT_TEXT_PLAIN);
    response->setBody(body);
    return response;
}

}  // namespace

backends::Result<SaveChunkRequest> parseSaveChunkRequest(const std::string &name,
                                                         const std::string &order,
                                                         const std::string &size,
                                                         std::size_t bodyLength) {
    backends::Result<SaveChunkRequest> result;

    if (name.empty()) {
        result.error = backends::makeError("validation_error", "missing_name", "name is required");
        return result;
    }

    SaveChunkRequest request;
    request.name = name;
    if (!parseNumber(order, request.order)) {
        result.error = backends::makeError("validation_error", "invalid_order", "order must be a non-negative integer");
        return result;
    }

    request.size = bodyLength;
    if (!size.empty()) {
        std::size_t declared = 0;
        if (!parseNumber(size, declared)) {
            result.error = backends::makeError("validation_error", "invalid_size", "size must be a non-negative integer");
            return result;
        }
        if (declared != bodyLength) {
            result.error = backends::makeError("validation_error", "size_mismatch",
                                               "size " + std::to_string(declared) + " does not match body length " +
                                                   std::to_string(bodyLength));
            return result;
        }
    }

    result.data = std::move(request);
    return result;
}

void registerNodeRoutes(drogon::HttpAppFramework &app, std::shared_ptr<backends::MemoryBackend> store) {
    app.registerHandler(
        "/save-chunk",
        [store](const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback) {
            const auto body = req->body();
            auto parsed = parseSaveChunkRequest(req->getParameter("name"), req->getParameter("order"),
                                                req->getParameter("size"), body.size());
            if (!parsed.ok()) {
                LOG_WARN << "Rejected save-chunk: " << parsed.error->message;
                callback(textResponse(drogon::k400BadRequest, parsed.error->message));
                return;
            }

            const auto &request = *parsed.data;
            auto saved = store->saveChunk(request.name, request.order,
                                          reinterpret_cast<const std::uint8_t *>(body.data()), body.size());
            if (!saved.ok()) {
                callback(textResponse(drogon::k500InternalServerError, saved.error->message));
                return;
            }

            LOG_INFO << "Stored chunk " << request.order << " of " << request.name << " (" << request.size
                     << " bytes)";
            callback(textResponse(drogon::k200OK, "ok"));
        },
        {drogon::Post});

    app.registerHandler(
        "/get-chunk",
        [store](const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback) {
            const auto name = req->getParameter("name");
            if (name.empty()) {
                callback(textResponse(drogon::k400BadRequest, "name is required"));
                return;
            }

            auto fetched = store->getChunk(name);
            if (!fetched.ok()) {
                const auto status =
                    fetched.error->type == "not_found" ? drogon::k404NotFound : drogon::k500InternalServerError;
                callback(textResponse(status, fetched.error->message));
                return;
            }

            const auto &chunk = *fetched.data;
            auto response = HttpResponse::newHttpResponse();
            response->setStatusCode(drogon::k200OK);
            response->setContentTypeCode(drogon::CT_APPLICATION_OCTET_STREAM);
            response->addHeader("X-Chunk-Order", std::to_string(chunk.order));
            response->setBody(std::string(chunk.data.begin(), chunk.data.end()));
            callback(response);
        },
        {drogon::Get});
}

}  // namespace chunkgate::node
