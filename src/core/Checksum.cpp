#include "core/Checksum.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace chunkgate::core {
namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string toHex(const unsigned char *digest, unsigned int length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result(static_cast<std::size_t>(length) * 2, '\0');
    for (unsigned int i = 0; i < length; ++i) {
        result[i * 2] = hexChars[(digest[i] >> 4) & 0x0fu];
        result[i * 2 + 1] = hexChars[digest[i] & 0x0fu];
    }
    return result;
}

}  // namespace

std::string sha256Hex(const std::uint8_t *data, std::size_t size) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return toHex(digest.data(), length);
}

}  // namespace chunkgate::core
