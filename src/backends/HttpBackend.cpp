#include "backends/HttpBackend.hpp"

#include <drogon/drogon.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

namespace chunkgate::backends {
namespace {

constexpr const char *kSavePath = "save-chunk";
constexpr const char *kGetPath = "get-chunk";
constexpr const char *kOrderHeader = "x-chunk-order";

bool isSuccess(long statusCode) {
    return statusCode >= 200 && statusCode < 300;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::uint32_t parseOrder(const cpr::Response &response, std::uint32_t fallback) {
    for (const auto &entry : response.header) {
        if (toLower(entry.first) != kOrderHeader) {
            continue;
        }
        try {
            return static_cast<std::uint32_t>(std::stoul(entry.second));
        } catch (const std::exception &) {
            return fallback;
        }
    }
    return fallback;
}

}  // namespace

HttpBackend::HttpBackend(HttpBackendConfig config) : config_(std::move(config)) {}

HttpBackend::~HttpBackend() = default;

Result<SaveAck> HttpBackend::saveChunk(const std::string &name, std::uint32_t order, const std::uint8_t *data,
                                       std::size_t size) {
    Result<SaveAck> result;

    if (auto error = configurationError()) {
        result.error = std::move(error);
        return result;
    }

    cpr::Session session;
    configureSession(session, kSavePath);
    session.SetParameters(cpr::Parameters{
        {"name", name},
        {"order", std::to_string(order)},
        {"size", std::to_string(size)},
    });
    session.SetHeader(cpr::Header{{"Content-Type", "application/octet-stream"}});
    session.SetBody(cpr::Body{std::string(reinterpret_cast<const char *>(data), size)});

    LOG_DEBUG << "Sending resource " << name << " chunk order " << order << " (" << size << " bytes) to "
              << config_.baseUrl;

    cpr::Response response = session.Post();
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = makeNetworkError(response);
        return result;
    }
    if (!isSuccess(response.status_code)) {
        result.error = makeStatusError(response, "Storage node rejected the chunk.");
        return result;
    }

    result.data = SaveAck{size};
    return result;
}

Result<Chunk> HttpBackend::getChunk(const std::string &name) {
    Result<Chunk> result;

    if (auto error = configurationError()) {
        result.error = std::move(error);
        return result;
    }

    cpr::Session session;
    configureSession(session, kGetPath);
    session.SetParameters(cpr::Parameters{{"name", name}});
    session.SetHeader(cpr::Header{{"Accept", "application/octet-stream"}});

    cpr::Response response = session.Get();
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = makeNetworkError(response);
        return result;
    }
    if (response.status_code == 404) {
        result.error = makeError("not_found", "chunk_not_found",
                                 response.text.empty() ? "resource \"" + name + "\" not found" : response.text,
                                 config_.name);
        return result;
    }
    if (!isSuccess(response.status_code)) {
        result.error = makeStatusError(response, "Storage node failed to return the chunk.");
        return result;
    }

    Chunk chunk;
    chunk.order = parseOrder(response, 0);
    chunk.data.assign(response.text.begin(), response.text.end());
    result.data = std::move(chunk);
    return result;
}

std::optional<Error> HttpBackend::configurationError() const {
    if (config_.baseUrl.empty()) {
        return makeError("backend_error", "missing_base_url", "Backend address is not configured.", config_.name);
    }
    return std::nullopt;
}

std::string HttpBackend::buildUrl(const std::string &path) const {
    std::string base = config_.baseUrl;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        base.push_back('/');
    }
    base.append(path);
    return base;
}

void HttpBackend::configureSession(cpr::Session &session, const std::string &path) const {
    session.SetUrl(cpr::Url{buildUrl(path)});
    session.SetTimeout(cpr::Timeout{static_cast<int>(config_.timeout.count())});
    session.SetConnectTimeout(cpr::ConnectTimeout{static_cast<int>(config_.connectTimeout.count())});
    session.SetUserAgent(cpr::UserAgent{"chunkgate/0.1.0"});
}

Error HttpBackend::makeNetworkError(const cpr::Response &response) const {
    return makeError("network_error", "network_error",
                     response.error.message.empty() ? "Transport failure talking to storage node."
                                                    : response.error.message,
                     config_.name);
}

Error HttpBackend::makeStatusError(const cpr::Response &response, const std::string &fallback) const {
    return makeError("backend_error", std::to_string(response.status_code),
                     response.text.empty() ? fallback : response.text, config_.name);
}

}  // namespace chunkgate::backends
