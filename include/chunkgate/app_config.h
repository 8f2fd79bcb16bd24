#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace chunkgate {

struct AppConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    std::size_t threads{0};
    std::uint64_t maxUploadBytes{64ULL * 1024 * 1024};
    std::string logLevel{"info"};
};

AppConfig loadAppConfig(const YAML::Node &serverConfig, const YAML::Node &loggingConfig);
void applyAppConfig(const AppConfig &config);

}  // namespace chunkgate
