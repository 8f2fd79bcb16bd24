#include "chunkgate/middleware/request_id.h"

#include "chunkgate/logging.h"
#include "core/Metrics.hpp"

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/utils/Utilities.h>

#include <algorithm>
#include <cstdint>
#include <memory>

namespace chunkgate::middleware {
namespace {

constexpr std::size_t kMaxRequestIdLength = 128;

std::shared_ptr<core::RequestObservation> observationOf(const drogon::HttpRequestPtr &req) {
    auto attributes = req->attributes();
    if (!attributes || !attributes->find(RequestIdMiddleware::kObservationAttribute)) {
        return nullptr;
    }
    return attributes->get<std::shared_ptr<core::RequestObservation>>(RequestIdMiddleware::kObservationAttribute);
}

}  // namespace

void RequestIdMiddleware::doFilter(const drogon::HttpRequestPtr &req,
                                   drogon::FilterCallback &&,
                                   drogon::FilterChainCallback &&fccb) {
    auto requestId = req->getHeader("X-Request-ID");
    if (!isUsableId(requestId)) {
        requestId = drogon::utils::genRandomString(16);
    }
    req->attributes()->insert(kRequestIdAttribute, requestId);

    const std::string endpoint{req->path()};
    req->attributes()->insert(kObservationAttribute,
                              core::MetricsRegistry::instance().startRequest(
                                  std::string(req->methodString()), endpoint,
                                  static_cast<std::uint64_t>(req->bodyLength())));

    LogContext context{};
    context.requestId = requestId;
    context.endpoint = endpoint;
    setLogContext(context);

    fccb();
}

std::string RequestIdMiddleware::resolve(const drogon::HttpRequestPtr &req) {
    if (!req) {
        return {};
    }
    auto attributes = req->attributes();
    if (attributes && attributes->find(kRequestIdAttribute)) {
        return attributes->get<std::string>(kRequestIdAttribute);
    }
    return req->getHeader("X-Request-ID");
}

void RequestIdMiddleware::installCompletionAdvice(drogon::HttpAppFramework &app) {
    app.registerPostHandlingAdvice([](const drogon::HttpRequestPtr &req, const drogon::HttpResponsePtr &resp) {
        const auto requestId = resolve(req);
        const auto status = resp ? static_cast<unsigned>(resp->getStatusCode()) : 0U;
        if (resp && !requestId.empty()) {
            resp->addHeader("X-Request-ID", requestId);
        }

        auto observation = observationOf(req);
        if (observation) {
            observation->complete(status, resp ? static_cast<std::uint64_t>(resp->body().size()) : 0U);
        }

        LogContext context{};
        context.requestId = requestId;
        context.status = static_cast<int>(status);
        context.latencyMs = observation ? observation->latencyMs() : 0.0;
        updateLogContext(context);
        LOG_INFO << req->methodString() << ' ' << req->path() << " -> " << status;
        clearLogContext();
    });
}

bool RequestIdMiddleware::isUsableId(const std::string &candidate) {
    if (candidate.empty() || candidate.size() > kMaxRequestIdLength) {
        return false;
    }
    return std::all_of(candidate.begin(), candidate.end(), [](unsigned char c) { return c > 0x20 && c < 0x7f; });
}

}  // namespace chunkgate::middleware
