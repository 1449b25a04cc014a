#pragma once
#include <string>

namespace Umbra {
namespace Target {

struct Target {
    std::string raw;
    std::string normalized;
    std::string content_address;
    std::string invalid_reason;
    bool        valid = false;

    // Log-safe identifier: prefix of the content-address.
    std::string short_id() const {
        return content_address.substr(0, 12);
    }

    // Normalizes, validates and hashes `raw`. Invalid inputs keep a
    // content-address derived from the raw text so they can be reported.
    static Target from_raw(const std::string& raw);
};

class OnionValidator {
public:
    static constexpr size_t V2_LABEL_LENGTH = 16;
    static constexpr size_t V3_LABEL_LENGTH = 56;

    // True for http(s) URLs whose host ends in an onion label of 16 or 56
    // base32 characters. On failure `reason` names the broken rule.
    static bool validate(const std::string& url, std::string* reason = nullptr);

    static bool is_base32_label(const std::string& label);
};

}  // namespace Target
}  // namespace Umbra
