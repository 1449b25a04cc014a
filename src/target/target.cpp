#include "target.hpp"
#include "../core/types/constants.hpp"
#include "../utils/crypto/digest.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Umbra {
namespace Target {

using namespace Umbra::Utils;

namespace {
bool fail(std::string* reason, const char* why) {
    if (reason)
        *reason = why;
    return false;
}
}  // namespace

bool OnionValidator::is_base32_label(const std::string& label) {
    if (label.empty())
        return false;
    for (char c : label) {
        bool letter = (c >= 'a' && c <= 'z');
        bool digit  = (c >= '2' && c <= '7');
        if (!letter && !digit)
            return false;
    }
    return true;
}

bool OnionValidator::validate(const std::string& url, std::string* reason) {
    UrlParsed parsed = Url::parse(Text::trim(url));
    if (parsed.scheme.empty() || parsed.host.empty())
        return fail(reason, "missing scheme or host");

    std::string scheme = Text::to_lower(parsed.scheme);
    if (scheme != "http" && scheme != "https")
        return fail(reason, "unsupported scheme");

    if (!parsed.port.empty()) {
        if (parsed.port.size() > 5
            || parsed.port.find_first_not_of("0123456789") != std::string::npos)
            return fail(reason, "invalid port");
    }

    std::string host = Text::to_lower(parsed.host);
    if (!Text::ends_with(host, Core::Constants::ONION_SUFFIX))
        return fail(reason, "host is not an onion address");

    std::string rest = host.substr(0, host.size() - std::string(Core::Constants::ONION_SUFFIX).size());
    size_t      dot  = rest.find_last_of('.');
    std::string label = (dot == std::string::npos) ? rest : rest.substr(dot + 1);

    if (label.size() != V2_LABEL_LENGTH && label.size() != V3_LABEL_LENGTH)
        return fail(reason, "onion label has invalid length");
    if (!is_base32_label(label))
        return fail(reason, "onion label has invalid characters");
    return true;
}

Target Target::from_raw(const std::string& raw) {
    Target target;
    target.raw = Text::trim(raw);

    std::string reason;
    target.valid = OnionValidator::validate(target.raw, &reason);
    if (target.valid) {
        target.normalized      = Url::normalize(target.raw);
        target.content_address = Crypto::sha256_hex(target.normalized);
    }
    else {
        target.invalid_reason  = reason;
        target.content_address = Crypto::sha256_hex(target.raw);
    }
    return target;
}

}  // namespace Target
}  // namespace Umbra
