#include "chunkgate/backends.h"

#include "backends/HttpBackend.hpp"
#include "backends/MemoryBackend.hpp"
#include "chunkgate/environment.h"

#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>

namespace chunkgate {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::chrono::milliseconds parseDuration(const YAML::Node &node, std::chrono::milliseconds fallback) {
    auto scalar = resolveScalar(node);
    if (scalar.empty()) {
        return fallback;
    }
    try {
        return std::chrono::milliseconds(std::stoll(scalar));
    } catch (const std::exception &) {
        return fallback;
    }
}

using BackendFactory = std::function<std::shared_ptr<backends::IBackend>(const BackendSpec &)>;

const std::unordered_map<std::string, BackendFactory> &factories() {
    static const std::unordered_map<std::string, BackendFactory> table = {
        {"memory",
         [](const BackendSpec &spec) {
             return std::make_shared<backends::MemoryBackend>(spec.name, spec.address);
         }},
        {"http",
         [](const BackendSpec &spec) {
             backends::HttpBackendConfig config;
             config.name = spec.name;
             config.baseUrl = spec.address;
             config.timeout = spec.timeout;
             config.connectTimeout = spec.connectTimeout;
             return std::make_shared<backends::HttpBackend>(std::move(config));
         }},
    };
    return table;
}

}  // namespace

std::string resolveScalar(const YAML::Node &node) {
    if (!node || !node.IsScalar()) {
        return {};
    }
    auto text = node.as<std::string>("");
    if (text.size() >= 3 && text.front() == '$' && text[1] == '{' && text.back() == '}') {
        auto inner = text.substr(2, text.size() - 3);
        auto delim = inner.find(":-");
        std::string envKey = inner.substr(0, delim == std::string::npos ? inner.size() : delim);
        std::string defaultValue = delim == std::string::npos ? std::string{} : inner.substr(delim + 2);
        return getEnvOrDefault(envKey, defaultValue);
    }
    return text;
}

std::vector<BackendSpec> loadBackendSpecs(const YAML::Node &config) {
    std::vector<BackendSpec> specs;
    if (!config) {
        return specs;
    }

    const auto list = config["backends"];
    if (!list || !list.IsSequence()) {
        LOG_WARN << "Backend configuration must contain a 'backends' sequence.";
        return specs;
    }

    for (std::size_t i = 0; i < list.size(); ++i) {
        const auto node = list[i];
        if (!node.IsMap()) {
            LOG_WARN << "Backend entry " << i << " must be a map; skipped.";
            continue;
        }

        BackendSpec spec;
        spec.name = resolveScalar(node["name"]);
        if (spec.name.empty()) {
            spec.name = "backend-" + std::to_string(i);
        }
        if (auto kind = resolveScalar(node["kind"]); !kind.empty()) {
            spec.kind = toLower(kind);
        }
        spec.address = resolveScalar(node["address"]);
        spec.timeout = parseDuration(node["timeout_ms"], spec.timeout);
        spec.connectTimeout = parseDuration(node["connect_timeout_ms"], spec.connectTimeout);
        specs.push_back(std::move(spec));
    }
    return specs;
}

std::vector<BackendSpec> defaultBackendSpecs() {
    std::vector<BackendSpec> specs;
    for (int port = 8081; port <= 8086; ++port) {
        BackendSpec spec;
        spec.name = "memory-" + std::to_string(port - 8081);
        spec.kind = "memory";
        spec.address = "http://localhost:" + std::to_string(port);
        specs.push_back(std::move(spec));
    }
    return specs;
}

backends::Result<backends::BackendList> buildBackends(const std::vector<BackendSpec> &specs) {
    backends::Result<backends::BackendList> result;
    backends::BackendList list;
    list.reserve(specs.size());

    for (const auto &spec : specs) {
        auto factory = factories().find(spec.kind);
        if (factory == factories().end()) {
            result.error = backends::makeError("validation_error", "unknown_backend_kind",
                                               "Backend " + spec.name + " has unknown kind '" + spec.kind + "'.",
                                               spec.name);
            return result;
        }
        if (spec.kind == "http" && spec.address.empty()) {
            result.error = backends::makeError("validation_error", "missing_address",
                                               "Backend " + spec.name + " requires an address.", spec.name);
            return result;
        }
        LOG_INFO << "Configured backend " << spec.name << " (" << spec.kind << ") at " << spec.address;
        list.push_back(factory->second(spec));
    }

    result.data = std::move(list);
    return result;
}

}  // namespace chunkgate
