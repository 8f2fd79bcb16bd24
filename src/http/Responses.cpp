#include "http/Responses.hpp"

namespace chunkgate::http {

drogon::HttpStatusCode statusFromErrorType(const backends::Error &error) {
    if (error.type == "validation_error") {
        return drogon::k400BadRequest;
    }
    if (error.type == "not_found") {
        return drogon::k404NotFound;
    }
    return drogon::k500InternalServerError;
}

std::string publicMessage(const backends::Error &error, const std::string &fallback) {
    if (error.type == "validation_error" || error.type == "not_found") {
        return error.message;
    }
    return fallback;
}

Json::Value buildErrorPayload(const backends::Error &error, const std::string &message, const std::string &requestId) {
    Json::Value body(Json::objectValue);
    body["type"] = error.type;
    body["message"] = message;
    body["code"] = error.code;
    body["request_id"] = requestId;

    Json::Value payload(Json::objectValue);
    payload["error"] = body;
    return payload;
}

Json::Value buildUploadPayload(const core::UploadReceipt &receipt) {
    Json::Value payload(Json::objectValue);
    payload["resource"] = receipt.resourceId;
    payload["checksum"] = receipt.checksum;
    return payload;
}

std::string contentDisposition(const std::string &fileName) {
    std::string escaped;
    escaped.reserve(fileName.size());
    for (char ch : fileName) {
        if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f) {
            continue;
        }
        if (ch == '"' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return "attachment; filename=\"" + escaped + "\"";
}

}  // namespace chunkgate::http
