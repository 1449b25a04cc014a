#pragma once
#include <array>
#include <string>

namespace Umbra {
namespace Identity {

enum class TlsProfile {
    Chrome108,
    Chrome111,
    Firefox102,
    Firefox108,
    Safari16,
    Edge106,
    Opera90
};

inline constexpr std::array<TlsProfile, 7> ALL_TLS_PROFILES = {TlsProfile::Chrome108,
                                                               TlsProfile::Chrome111,
                                                               TlsProfile::Firefox102,
                                                               TlsProfile::Firefox108,
                                                               TlsProfile::Safari16,
                                                               TlsProfile::Edge106,
                                                               TlsProfile::Opera90};

std::string to_string(TlsProfile profile);

// OpenSSL cipher string (TLS 1.2 suites) in the client's advertised order.
const char* cipher_list(TlsProfile profile);

// Supported groups in the client's advertised order.
const char* groups_list(TlsProfile profile);

}  // namespace Identity
}  // namespace Umbra
