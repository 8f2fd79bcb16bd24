#pragma once

#include "backends/IBackend.hpp"
#include "core/UploadOrchestrator.hpp"

#include <drogon/HttpTypes.h>
#include <json/json.h>

#include <string>

namespace chunkgate::http {

drogon::HttpStatusCode statusFromErrorType(const backends::Error &error);

// Client-input errors keep their message; anything else is replaced by
// `fallback` so backend details never reach the caller.
std::string publicMessage(const backends::Error &error, const std::string &fallback);

Json::Value buildErrorPayload(const backends::Error &error, const std::string &message, const std::string &requestId);
Json::Value buildUploadPayload(const core::UploadReceipt &receipt);

std::string contentDisposition(const std::string &fileName);

}  // namespace chunkgate::http
