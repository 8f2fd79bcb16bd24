#pragma once

#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace chunkgate {

struct LogContext {
    std::string requestId;
    std::string endpoint;
    std::string resourceId;
    int status{0};
    double latencyMs{0.0};
};

// Routes every trantor LOG_* line through a JSON-lines emitter on stdout and,
// when configured, a file sink.
void initializeLogging(const std::string &level, const YAML::Node &loggingConfig);

void setLogContext(const LogContext &context);
void updateLogContext(const LogContext &context);
LogContext currentLogContext();
void clearLogContext();

}  // namespace chunkgate
