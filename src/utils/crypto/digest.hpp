#pragma once
#include <string>

namespace Umbra {
namespace Utils {
namespace Crypto {

// Lowercase hex SHA-256 of `data`. Throws std::runtime_error if OpenSSL fails.
std::string sha256_hex(const std::string& data);

}  // namespace Crypto
}  // namespace Utils
}  // namespace Umbra
