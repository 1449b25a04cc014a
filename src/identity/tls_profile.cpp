#include "tls_profile.hpp"

namespace Umbra {
namespace Identity {

namespace {
constexpr const char* CHROMIUM_CIPHERS =
    "ECDHE-ECDSA-AES128-GCM-SHA256:ECDHE-RSA-AES128-GCM-SHA256:ECDHE-ECDSA-AES256-GCM-SHA384:"
    "ECDHE-RSA-AES256-GCM-SHA384:ECDHE-ECDSA-CHACHA20-POLY1305:ECDHE-RSA-CHACHA20-POLY1305:"
    "ECDHE-RSA-AES128-SHA:ECDHE-RSA-AES256-SHA:AES128-GCM-SHA256:AES256-GCM-SHA384:AES128-SHA:"
    "AES256-SHA";

constexpr const char* FIREFOX_CIPHERS =
    "ECDHE-ECDSA-AES128-GCM-SHA256:ECDHE-RSA-AES128-GCM-SHA256:ECDHE-ECDSA-CHACHA20-POLY1305:"
    "ECDHE-RSA-CHACHA20-POLY1305:ECDHE-ECDSA-AES256-GCM-SHA384:ECDHE-RSA-AES256-GCM-SHA384:"
    "ECDHE-ECDSA-AES256-SHA:ECDHE-ECDSA-AES128-SHA:ECDHE-RSA-AES128-SHA:ECDHE-RSA-AES256-SHA:"
    "AES128-GCM-SHA256:AES256-GCM-SHA384:AES128-SHA:AES256-SHA";

constexpr const char* SAFARI_CIPHERS =
    "ECDHE-ECDSA-AES256-GCM-SHA384:ECDHE-ECDSA-AES128-GCM-SHA256:ECDHE-ECDSA-CHACHA20-POLY1305:"
    "ECDHE-RSA-AES256-GCM-SHA384:ECDHE-RSA-AES128-GCM-SHA256:ECDHE-RSA-CHACHA20-POLY1305:"
    "ECDHE-ECDSA-AES256-SHA384:ECDHE-ECDSA-AES128-SHA256:ECDHE-RSA-AES256-SHA384:"
    "ECDHE-RSA-AES128-SHA256:AES256-GCM-SHA384:AES128-GCM-SHA256";

constexpr const char* CHROMIUM_GROUPS = "X25519:P-256:P-384";
constexpr const char* FIREFOX_GROUPS  = "X25519:P-256:P-384:P-521:ffdhe2048:ffdhe3072";
constexpr const char* SAFARI_GROUPS   = "X25519:P-256:P-384:P-521";
}  // namespace

std::string to_string(TlsProfile profile) {
    switch (profile) {
        case TlsProfile::Chrome108: return "chrome_108";
        case TlsProfile::Chrome111: return "chrome_111";
        case TlsProfile::Firefox102: return "firefox_102";
        case TlsProfile::Firefox108: return "firefox_108";
        case TlsProfile::Safari16: return "safari_16_0";
        case TlsProfile::Edge106: return "edge_106";
        case TlsProfile::Opera90: return "opera_90";
    }
    return "chrome_108";
}

const char* cipher_list(TlsProfile profile) {
    switch (profile) {
        case TlsProfile::Firefox102:
        case TlsProfile::Firefox108: return FIREFOX_CIPHERS;
        case TlsProfile::Safari16: return SAFARI_CIPHERS;
        default: return CHROMIUM_CIPHERS;
    }
}

const char* groups_list(TlsProfile profile) {
    switch (profile) {
        case TlsProfile::Firefox102:
        case TlsProfile::Firefox108: return FIREFOX_GROUPS;
        case TlsProfile::Safari16: return SAFARI_GROUPS;
        default: return CHROMIUM_GROUPS;
    }
}

}  // namespace Identity
}  // namespace Umbra
