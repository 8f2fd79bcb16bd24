#include "core/Metrics.hpp"

#include <trantor/utils/Logger.h>

#include <exception>
#include <iomanip>
#include <mutex>

namespace chunkgate::core {
namespace {

void writeFamily(std::ostringstream &out, std::string_view name, std::string_view type, std::string_view help) {
    out << "# HELP " << name << ' ' << help << "\n";
    out << "# TYPE " << name << ' ' << type << "\n";
}

std::string fixed(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << value;
    return oss.str();
}

}  // namespace

void LatencyHistogram::observe(double valueMs) {
    std::size_t slot = 0;
    while (slot < kBounds.size() && valueMs > kBounds[slot]) {
        ++slot;
    }
    ++counts[slot];
    sum += valueMs;
    ++count;
}

MetricsRegistry &MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

std::shared_ptr<RequestObservation> MetricsRegistry::startRequest(std::string method,
                                                                  std::string endpoint,
                                                                  std::uint64_t bytesIn) {
    return std::make_shared<RequestObservation>(*this, std::move(method), std::move(endpoint), bytesIn);
}

void MetricsRegistry::recordChunk(const std::string &backend,
                                  ChunkOperation operation,
                                  std::uint64_t bytes,
                                  bool success) {
    std::unique_lock lock(mutex_);
    auto &metrics = backends_[backend];
    auto &counters = operation == ChunkOperation::Save ? metrics.save : metrics.fetch;
    if (success) {
        ++counters.ok;
        counters.bytes += bytes;
    } else {
        ++counters.failed;
    }
}

void MetricsRegistry::recordUpload(bool success) {
    std::unique_lock lock(mutex_);
    ++(success ? uploadsOk_ : uploadsFailed_);
}

void MetricsRegistry::reset() {
    std::unique_lock lock(mutex_);
    routes_.clear();
    backends_.clear();
    uploadsOk_ = 0;
    uploadsFailed_ = 0;
}

void MetricsRegistry::recordRequest(const RouteKey &route,
                                    double latencyMs,
                                    std::uint64_t bytesIn,
                                    std::uint64_t bytesOut,
                                    const std::string &errorType) {
    std::unique_lock lock(mutex_);
    auto &metrics = routes_[route];
    ++metrics.requests;
    metrics.bytesIn += bytesIn;
    metrics.bytesOut += bytesOut;
    metrics.latency.observe(latencyMs);
    if (!errorType.empty()) {
        ++metrics.errors[errorType];
    }
}

std::string MetricsRegistry::escapeLabel(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char ch : value) {
        if (ch == '\n') {
            escaped += "\\n";
            continue;
        }
        if (ch == '\\' || ch == '"') {
            escaped += '\\';
        }
        escaped += ch;
    }
    return escaped;
}

std::string MetricsRegistry::renderPrometheus() const {
    std::ostringstream out;
    std::shared_lock lock(mutex_);

    writeFamily(out, "uploads_total", "counter", "Uploads by outcome.");
    out << "uploads_total{outcome=\"ok\"} " << uploadsOk_ << "\n";
    out << "uploads_total{outcome=\"failed\"} " << uploadsFailed_ << "\n";

    renderRoutes(out);
    renderBackends(out);
    return out.str();
}

void MetricsRegistry::renderRoutes(std::ostringstream &out) const {
    auto labelsFor = [](const RouteKey &route) {
        return "method=\"" + escapeLabel(route.first) + "\",endpoint=\"" + escapeLabel(route.second) + "\"";
    };

    writeFamily(out, "http_requests_total", "counter", "HTTP requests handled.");
    for (const auto &[route, metrics] : routes_) {
        out << "http_requests_total{" << labelsFor(route) << "} " << metrics.requests << "\n";
    }

    writeFamily(out, "http_bytes_in", "counter", "Request body bytes received.");
    for (const auto &[route, metrics] : routes_) {
        out << "http_bytes_in{" << labelsFor(route) << "} " << metrics.bytesIn << "\n";
    }

    writeFamily(out, "http_bytes_out", "counter", "Response body bytes sent.");
    for (const auto &[route, metrics] : routes_) {
        out << "http_bytes_out{" << labelsFor(route) << "} " << metrics.bytesOut << "\n";
    }

    writeFamily(out, "http_errors_total", "counter", "Error responses by type.");
    for (const auto &[route, metrics] : routes_) {
        for (const auto &[type, count] : metrics.errors) {
            out << "http_errors_total{" << labelsFor(route) << ",type=\"" << escapeLabel(type) << "\"} " << count
                << "\n";
        }
    }

    writeFamily(out, "http_latency_ms", "histogram", "Request latency in milliseconds.");
    for (const auto &[route, metrics] : routes_) {
        const auto labels = labelsFor(route);
        const auto &histogram = metrics.latency;
        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < LatencyHistogram::kBounds.size(); ++i) {
            cumulative += histogram.counts[i];
            out << "http_latency_ms_bucket{" << labels << ",le=\"" << fixed(LatencyHistogram::kBounds[i]) << "\"} "
                << cumulative << "\n";
        }
        out << "http_latency_ms_bucket{" << labels << ",le=\"+Inf\"} " << histogram.count << "\n";
        out << "http_latency_ms_sum{" << labels << "} " << fixed(histogram.sum) << "\n";
        out << "http_latency_ms_count{" << labels << "} " << histogram.count << "\n";
    }
}

void MetricsRegistry::renderBackends(std::ostringstream &out) const {
    auto writeOperation = [&out](const std::string &label, std::string_view op, const OperationCounters &counters) {
        out << "backend_chunks_total{" << label << ",op=\"" << op << "\",outcome=\"ok\"} " << counters.ok << "\n";
        out << "backend_chunks_total{" << label << ",op=\"" << op << "\",outcome=\"failed\"} " << counters.failed
            << "\n";
    };

    writeFamily(out, "backend_chunks_total", "counter", "Chunk operations per backend by outcome.");
    for (const auto &[backend, metrics] : backends_) {
        const auto label = "backend=\"" + escapeLabel(backend) + "\"";
        writeOperation(label, "save", metrics.save);
        writeOperation(label, "fetch", metrics.fetch);
    }

    writeFamily(out, "backend_bytes_total", "counter", "Chunk bytes moved per backend.");
    for (const auto &[backend, metrics] : backends_) {
        const auto label = "backend=\"" + escapeLabel(backend) + "\"";
        out << "backend_bytes_total{" << label << ",op=\"save\"} " << metrics.save.bytes << "\n";
        out << "backend_bytes_total{" << label << ",op=\"fetch\"} " << metrics.fetch.bytes << "\n";
    }
}

RequestObservation::RequestObservation(MetricsRegistry &registry,
                                       std::string method,
                                       std::string endpoint,
                                       std::uint64_t bytesIn)
    : registry_(registry),
      method_(std::move(method)),
      endpoint_(std::move(endpoint)),
      bytesIn_(bytesIn),
      start_(std::chrono::steady_clock::now()) {}

RequestObservation::~RequestObservation() noexcept {
    try {
        complete(0, 0, "abandoned");
    } catch (const std::exception &ex) {
        LOG_ERROR << "Failed to record abandoned request on " << endpoint_ << ": " << ex.what();
    }
}

void RequestObservation::complete(unsigned statusCode, std::uint64_t bytesOut, const std::string &errorType) {
    if (completed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    latencyMs_ = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    statusCode_ = statusCode;

    auto recordedError = errorType;
    if (recordedError.empty() && statusCode >= 400) {
        recordedError = statusCode >= 500 ? "http_5xx" : "http_4xx";
    }
    registry_.recordRequest({method_, endpoint_}, latencyMs_, bytesIn_, bytesOut, recordedError);
}

}  // namespace chunkgate::core
