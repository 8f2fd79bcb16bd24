#include "http/HttpServer.hpp"

#include "chunkgate/logging.h"
#include "chunkgate/middleware/request_id.h"
#include "core/Metrics.hpp"
#include "http/Responses.hpp"

#include <drogon/drogon.h>
#include <drogon/MultiPart.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace chunkgate::http {
namespace {

using drogon::HttpRequestPtr;
using drogon::HttpResponse;
using drogon::HttpResponsePtr;
using ResponseCallback = std::function<void(const HttpResponsePtr &)>;

void respondWithError(const ResponseCallback &callback,
                      const backends::Error &error,
                      const std::string &fallback,
                      const std::string &requestId) {
    auto response = HttpResponse::newHttpJsonResponse(buildErrorPayload(error, publicMessage(error, fallback), requestId));
    response->setStatusCode(statusFromErrorType(error));
    callback(response);
}

void handleUpload(const std::shared_ptr<Gateway> &gateway, const HttpRequestPtr &req, ResponseCallback &&callback) {
    const auto requestId = middleware::RequestIdMiddleware::resolve(req);

    drogon::MultiPartParser parser;
    if (parser.parse(req) != 0) {
        respondWithError(callback,
                         backends::makeError("validation_error", "invalid_multipart", "Failed to get the uploaded file"),
                         {}, requestId);
        return;
    }

    const auto &files = parser.getFiles();
    auto file = std::find_if(files.begin(), files.end(), [](const drogon::HttpFile &candidate) {
        return candidate.getItemName() == "file";
    });
    if (file == files.end()) {
        respondWithError(callback,
                         backends::makeError("validation_error", "missing_file", "Failed to get the uploaded file"),
                         {}, requestId);
        return;
    }

    const auto fileName = file->getFileName();
    LOG_INFO << "Received file: file_name=" << fileName << " file_size=" << file->fileLength();

    const core::ByteSpan content(reinterpret_cast<const std::uint8_t *>(file->fileData()), file->fileLength());
    auto result = gateway->uploader.upload(fileName, content);
    if (!result.ok()) {
        respondWithError(callback, *result.error, "Failed to upload file to storage", requestId);
        return;
    }

    LogContext context{};
    context.resourceId = result.data->resourceId;
    updateLogContext(context);

    auto response = HttpResponse::newHttpJsonResponse(buildUploadPayload(*result.data));
    response->setStatusCode(drogon::k201Created);
    callback(response);
}

void handleDownload(const std::shared_ptr<Gateway> &gateway, const HttpRequestPtr &req, ResponseCallback &&callback) {
    const auto requestId = middleware::RequestIdMiddleware::resolve(req);

    const auto resourceId = req->getParameter("resource_id");
    if (resourceId.empty()) {
        respondWithError(callback,
                         backends::makeError("validation_error", "missing_resource_id", "Resource ID is required"),
                         {}, requestId);
        return;
    }

    LogContext context{};
    context.resourceId = resourceId;
    updateLogContext(context);
    LOG_INFO << "Received download request";

    auto result = gateway->downloader.download(resourceId);
    if (!result.ok()) {
        respondWithError(callback, *result.error, "Failed to get file chunk", requestId);
        return;
    }

    const auto &file = *result.data;
    auto response = HttpResponse::newHttpResponse();
    response->setStatusCode(drogon::k200OK);
    response->setContentTypeCode(drogon::CT_APPLICATION_OCTET_STREAM);
    response->addHeader("Content-Disposition", contentDisposition(file.fileName));
    response->setBody(std::string(file.content.begin(), file.content.end()));
    callback(response);
}

}  // namespace

void HttpServer::registerRoutes(std::shared_ptr<Gateway> gateway) {
    auto &app = drogon::app();

    app.registerHandler(
        "/upload",
        [gateway](const HttpRequestPtr &req, ResponseCallback &&callback) {
            handleUpload(gateway, req, std::move(callback));
        },
        {drogon::Post, middleware::RequestIdMiddleware::classTypeName()});

    app.registerHandler(
        "/download",
        [gateway](const HttpRequestPtr &req, ResponseCallback &&callback) {
            handleDownload(gateway, req, std::move(callback));
        },
        {drogon::Get, middleware::RequestIdMiddleware::classTypeName()});
}

void HttpServer::registerOperationalRoutes(std::shared_ptr<Gateway> gateway,
                                           std::string version,
                                           std::chrono::system_clock::time_point startedAt) {
    auto &app = drogon::app();

    app.registerHandler(
        "/health",
        [gateway, version = std::move(version), startedAt](const HttpRequestPtr &, ResponseCallback &&callback) {
            const auto uptime =
                std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - startedAt);

            Json::Value payload(Json::objectValue);
            payload["status"] = "ok";
            payload["service"] = "chunkgate";
            payload["version"] = version;
            payload["backends"] = static_cast<Json::UInt64>(gateway->backends.size());
            payload["resources"] = static_cast<Json::UInt64>(gateway->registry.size());
            payload["uptime_seconds"] = static_cast<Json::Int64>(uptime.count());
            callback(HttpResponse::newHttpJsonResponse(payload));
        },
        {drogon::Get, middleware::RequestIdMiddleware::classTypeName()});

    app.registerHandler(
        "/metrics",
        [](const HttpRequestPtr &, ResponseCallback &&callback) {
            auto response = HttpResponse::newHttpResponse();
            response->setContentTypeString("text/plain; version=0.0.4");
            response->setBody(core::MetricsRegistry::instance().renderPrometheus());
            callback(response);
        },
        {drogon::Get, middleware::RequestIdMiddleware::classTypeName()});
}

}  // namespace chunkgate::http
