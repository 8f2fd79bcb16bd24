#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace chunkgate::core {

class RequestObservation;

enum class ChunkOperation {
    Save,
    Fetch,
};

// Fixed-bucket latency histogram in milliseconds. The last slot counts
// observations above the largest bound.
struct LatencyHistogram {
    static constexpr std::array<double, 10> kBounds{1.0, 2.5, 5.0, 10.0, 25.0, 50.0, 100.0, 250.0, 500.0, 1000.0};

    std::array<std::uint64_t, kBounds.size() + 1> counts{};
    double sum{0.0};
    std::uint64_t count{0};

    void observe(double valueMs);
};

class MetricsRegistry {
  public:
    static MetricsRegistry &instance();

    std::shared_ptr<RequestObservation> startRequest(std::string method, std::string endpoint, std::uint64_t bytesIn);

    void recordChunk(const std::string &backend, ChunkOperation operation, std::uint64_t bytes, bool success);
    void recordUpload(bool success);

    std::string renderPrometheus() const;

    // Test hook; production code never clears the registry.
    void reset();

  private:
    friend class RequestObservation;

    using RouteKey = std::pair<std::string, std::string>;

    struct RouteMetrics {
        std::uint64_t requests{0};
        std::uint64_t bytesIn{0};
        std::uint64_t bytesOut{0};
        std::map<std::string, std::uint64_t> errors;
        LatencyHistogram latency;
    };

    struct OperationCounters {
        std::uint64_t ok{0};
        std::uint64_t failed{0};
        std::uint64_t bytes{0};
    };

    struct BackendMetrics {
        OperationCounters save;
        OperationCounters fetch;
    };

    MetricsRegistry() = default;

    void recordRequest(const RouteKey &route,
                       double latencyMs,
                       std::uint64_t bytesIn,
                       std::uint64_t bytesOut,
                       const std::string &errorType);

    void renderRoutes(std::ostringstream &out) const;
    void renderBackends(std::ostringstream &out) const;

    static std::string escapeLabel(std::string_view value);

    mutable std::shared_mutex mutex_;
    std::map<RouteKey, RouteMetrics> routes_;
    std::map<std::string, BackendMetrics> backends_;
    std::uint64_t uploadsOk_{0};
    std::uint64_t uploadsFailed_{0};
};

// Tracks one in-flight request. complete() records it exactly once; an
// observation dropped without completing is recorded as "abandoned".
class RequestObservation {
  public:
    RequestObservation(MetricsRegistry &registry, std::string method, std::string endpoint, std::uint64_t bytesIn);
    ~RequestObservation() noexcept;

    RequestObservation(const RequestObservation &) = delete;
    RequestObservation &operator=(const RequestObservation &) = delete;

    void complete(unsigned statusCode, std::uint64_t bytesOut, const std::string &errorType = "");

    double latencyMs() const { return latencyMs_; }
    unsigned statusCode() const { return statusCode_; }
    const std::string &endpoint() const { return endpoint_; }

  private:
    MetricsRegistry &registry_;
    std::string method_;
    std::string endpoint_;
    std::uint64_t bytesIn_;
    std::chrono::steady_clock::time_point start_;
    std::atomic<bool> completed_{false};
    double latencyMs_{0.0};
    unsigned statusCode_{0};
};

}  // namespace chunkgate::core
