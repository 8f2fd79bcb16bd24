#include "chunkgate/app_config.h"

#include "chunkgate/environment.h"

#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

namespace chunkgate {
namespace {

std::optional<std::uint16_t> parsePort(std::string_view text) {
    unsigned long value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value == 0 || value > 65535UL) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

// listeners[0] only; drogon supports more but the gateway binds one socket.
void readListener(const YAML::Node &serverConfig, AppConfig &config) {
    const auto listeners = serverConfig["listeners"];
    if (!listeners || !listeners.IsSequence() || listeners.size() == 0) {
        return;
    }
    const auto listener = listeners[0];
    config.host = listener["address"].as<std::string>(config.host);
    if (auto port = parsePort(listener["port"].as<std::string>(""))) {
        config.port = *port;
    }
}

void readAppSection(const YAML::Node &serverConfig, AppConfig &config) {
    const auto app = serverConfig["app"];
    if (!app) {
        return;
    }
    config.threads = app["threads"].as<std::size_t>(config.threads);
    config.maxUploadBytes = app["max_upload_bytes"].as<std::uint64_t>(config.maxUploadBytes);
}

void applyEnvironment(AppConfig &config) {
    config.host = getEnvOrDefault("HOST", config.host);
    if (auto port = getEnv("PORT")) {
        config.port = parsePort(*port).value_or(config.port);
    }
    config.maxUploadBytes = getEnvUnsigned("CHUNKGATE_MAX_UPLOAD_BYTES", config.maxUploadBytes);
    config.logLevel = getEnvOrDefault("LOG_LEVEL", config.logLevel);
}

}  // namespace

AppConfig loadAppConfig(const YAML::Node &serverConfig, const YAML::Node &loggingConfig) {
    AppConfig config;

    if (serverConfig) {
        readListener(serverConfig, config);
        readAppSection(serverConfig, config);
    }
    if (loggingConfig && loggingConfig["logging"]) {
        config.logLevel = loggingConfig["logging"]["level"].as<std::string>(config.logLevel);
    }

    applyEnvironment(config);
    return config;
}

void applyAppConfig(const AppConfig &config) {
    drogon::app()
        .addListener(config.host, config.port)
        .setClientMaxBodySize(static_cast<size_t>(config.maxUploadBytes))
        .setClientMaxMemoryBodySize(static_cast<size_t>(config.maxUploadBytes));
    if (config.threads > 0) {
        drogon::app().setThreadNum(config.threads);
    }
}

}  // namespace chunkgate
