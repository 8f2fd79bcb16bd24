#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "chunkgate/app_config.h"
#include "chunkgate/backends.h"
#include "chunkgate/environment.h"
#include "chunkgate/gateway.h"
#include "chunkgate/logging.h"
#include "chunkgate/middleware/request_id.h"
#include "chunkgate/shutdown.h"
#include "http/HttpServer.hpp"

namespace {

constexpr const char *kVersion = "0.1.0";

// Missing files are normal; a file that exists but does not parse is reported
// and treated as empty.
YAML::Node loadOptionalYaml(const std::string &path) {
    try {
        return YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        return {};
    } catch (const std::exception &ex) {
        std::cerr << "Failed to load " << path << ": " << ex.what() << std::endl;
    }
    return {};
}

}  // namespace

int main() {
    chunkgate::loadDotEnv(".env");

    const auto serverConfig = loadOptionalYaml("config/server.yaml");
    const auto loggingConfig = loadOptionalYaml("config/logging.yaml");
    const auto backendConfig = loadOptionalYaml("config/backends.yaml");

    const auto config = chunkgate::loadAppConfig(serverConfig, loggingConfig);
    chunkgate::initializeLogging(config.logLevel, loggingConfig);

    auto specs = chunkgate::loadBackendSpecs(backendConfig);
    if (specs.empty()) {
        LOG_WARN << "No backends configured; falling back to six in-memory backends.";
        specs = chunkgate::defaultBackendSpecs();
    }

    auto backends = chunkgate::buildBackends(specs);
    if (!backends.ok()) {
        LOG_FATAL << "Invalid backend configuration: " << backends.error->message;
        return 1;
    }
    auto gateway = std::make_shared<chunkgate::Gateway>(std::move(*backends.data));

    auto &application = drogon::app();
    application.enableServerHeader(false).enableDateHeader(true);
    chunkgate::applyAppConfig(config);

    application.registerFilter(std::make_shared<chunkgate::middleware::RequestIdMiddleware>());
    chunkgate::middleware::RequestIdMiddleware::installCompletionAdvice(application);

    chunkgate::http::HttpServer::registerOperationalRoutes(gateway, kVersion, std::chrono::system_clock::now());
    chunkgate::http::HttpServer::registerRoutes(gateway);

    chunkgate::installShutdownHandlers();

    LOG_INFO << "Starting chunkgate " << kVersion << " on " << config.host << ':' << config.port << " with "
             << gateway->backends.size() << " backends";
    application.run();
    LOG_INFO << "chunkgate stopped.";

    return 0;
}
