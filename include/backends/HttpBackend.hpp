#pragma once

#include "backends/IBackend.hpp"

#include <cpr/cpr.h>

#include <chrono>
#include <optional>
#include <string>

namespace chunkgate::backends {

struct HttpBackendConfig {
    std::string name;
    std::string baseUrl;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connectTimeout{5000};
};

// Talks to a storage node over the save-chunk/get-chunk protocol. One request per
// call; failures are returned, never retried.
class HttpBackend : public IBackend {
   public:
    explicit HttpBackend(HttpBackendConfig config);
    ~HttpBackend() override;

    Result<SaveAck> saveChunk(const std::string &name, std::uint32_t order, const std::uint8_t *data,
                              std::size_t size) override;
    Result<Chunk> getChunk(const std::string &name) override;

    [[nodiscard]] const std::string &name() const override { return config_.name; }
    [[nodiscard]] const std::string &address() const override { return config_.baseUrl; }

   protected:
    std::string buildUrl(const std::string &path) const;
    void configureSession(cpr::Session &session, const std::string &path) const;

   private:
    std::optional<Error> configurationError() const;
    Error makeNetworkError(const cpr::Response &response) const;
    Error makeStatusError(const cpr::Response &response, const std::string &fallback) const;

    HttpBackendConfig config_;
};

}  // namespace chunkgate::backends
