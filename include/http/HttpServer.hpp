#pragma once

#include "chunkgate/gateway.h"

#include <chrono>
#include <memory>
#include <string>

namespace chunkgate::http {

class HttpServer {
  public:
    // POST /upload and GET /download.
    static void registerRoutes(std::shared_ptr<Gateway> gateway);

    // GET /health and GET /metrics.
    static void registerOperationalRoutes(std::shared_ptr<Gateway> gateway,
                                          std::string version,
                                          std::chrono::system_clock::time_point startedAt);
};

}  // namespace chunkgate::http
