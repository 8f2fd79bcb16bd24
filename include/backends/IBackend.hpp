#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkgate::backends {

using Bytes = std::vector<std::uint8_t>;

struct Error {
    std::string type;
    std::string message;
    std::string backend;
    std::string code;
};

template <typename T>
struct Result {
    std::optional<T> data;
    std::optional<Error> error;

    [[nodiscard]] bool ok() const { return data.has_value(); }
};

struct Chunk {
    std::uint32_t order{0};
    Bytes data;
};

struct SaveAck {
    std::size_t bytes{0};
};

Error makeError(std::string type, std::string code, std::string message, std::string backend = {});

// A storage endpoint holding at most one chunk per resource name.
class IBackend {
   public:
    virtual ~IBackend() = default;

    virtual Result<SaveAck> saveChunk(const std::string &name, std::uint32_t order, const std::uint8_t *data,
                                      std::size_t size) = 0;
    virtual Result<Chunk> getChunk(const std::string &name) = 0;

    [[nodiscard]] virtual const std::string &name() const = 0;
    [[nodiscard]] virtual const std::string &address() const = 0;
};

using BackendList = std::vector<std::shared_ptr<IBackend>>;

}  // namespace chunkgate::backends
