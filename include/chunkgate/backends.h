#pragma once

#include "backends/IBackend.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace chunkgate {

struct BackendSpec {
    std::string name;
    std::string kind{"memory"};
    std::string address;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connectTimeout{5000};
};

// Reads the `backends:` sequence. Scalars accept ${ENV:-default} expansion.
// Malformed entries are skipped with a warning.
std::vector<BackendSpec> loadBackendSpecs(const YAML::Node &config);

// Six in-memory backends addressed localhost:8081..8086.
std::vector<BackendSpec> defaultBackendSpecs();

// Builds one client per spec, in order. Fails on an unknown kind or on an http
// backend without an address.
backends::Result<backends::BackendList> buildBackends(const std::vector<BackendSpec> &specs);

std::string resolveScalar(const YAML::Node &node);

}  // namespace chunkgate
