#pragma once

#include <drogon/HttpFilter.h>

#include <string>

namespace drogon {
class HttpAppFramework;
}  // namespace drogon

namespace chunkgate::middleware {

// Tags every request with an id (the caller's X-Request-ID when usable) and
// starts its metrics observation.
class RequestIdMiddleware : public drogon::HttpFilter<RequestIdMiddleware, false> {
  public:
    static constexpr const char *kRequestIdAttribute = "request_id";
    static constexpr const char *kObservationAttribute = "observability.metrics";

    void doFilter(const drogon::HttpRequestPtr &req,
                  drogon::FilterCallback &&fcb,
                  drogon::FilterChainCallback &&fccb) override;

    static std::string resolve(const drogon::HttpRequestPtr &req);

    // Echoes X-Request-ID, completes the metrics observation and writes the
    // access log line once a response is ready.
    static void installCompletionAdvice(drogon::HttpAppFramework &app);

  private:
    static bool isUsableId(const std::string &candidate);
};

}  // namespace chunkgate::middleware
