#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "backends/MemoryBackend.hpp"
#include "chunkgate/environment.h"
#include "chunkgate/logging.h"
#include "chunkgate/shutdown.h"
#include "node/StorageNode.hpp"

namespace {

std::uint16_t resolvePort() {
    const auto fallback = std::uint16_t{8081};
    try {
        auto value = std::stoul(chunkgate::getEnvOrDefault("NODE_PORT", std::to_string(fallback)));
        if (value == 0 || value > 65535U) {
            return fallback;
        }
        return static_cast<std::uint16_t>(value);
    } catch (const std::exception &) {
        return fallback;
    }
}

}  // namespace

int main() {
    chunkgate::loadDotEnv(".env");

    const auto host = chunkgate::getEnvOrDefault("NODE_HOST", "0.0.0.0");
    const auto port = resolvePort();
    const auto name = chunkgate::getEnvOrDefault("NODE_NAME", "node-" + std::to_string(port));

    chunkgate::initializeLogging(chunkgate::getEnvOrDefault("LOG_LEVEL", "info"), YAML::Node{});

    auto store = std::make_shared<chunkgate::backends::MemoryBackend>(name, host + ":" + std::to_string(port));

    auto &application = drogon::app();
    application.enableServerHeader(false);
    application.addListener(host, port);
    application.setClientMaxBodySize(64 * 1024 * 1024);
    application.setClientMaxMemoryBodySize(64 * 1024 * 1024);

    chunkgate::node::registerNodeRoutes(application, store);
    chunkgate::installShutdownHandlers();

    LOG_INFO << "Starting storage node " << name << " on " << host << ':' << port;
    application.run();
    LOG_INFO << "Storage node stopped.";
    return 0;
}
