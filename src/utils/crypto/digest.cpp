#include "digest.hpp"
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace Umbra {
namespace Utils {
namespace Crypto {

namespace {
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
};
}  // namespace

std::string sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx)
        throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string           out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0F];
    }
    return out;
}

}  // namespace Crypto
}  // namespace Utils
}  // namespace Umbra
