#include "backends/IBackend.hpp"

#include <utility>

namespace chunkgate::backends {

Error makeError(std::string type, std::string code, std::string message, std::string backend) {
    Error error;
    error.type = std::move(type);
    error.code = std::move(code);
    error.message = std::move(message);
    error.backend = std::move(backend);
    return error;
}

}  // namespace chunkgate::backends
