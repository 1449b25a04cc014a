#pragma once
#include <string>

namespace Umbra {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // Lowercases scheme and host, drops default ports and the fragment,
    // collapses dot segments. Returns "" when there is no scheme or host.
    static std::string normalize(const std::string& url);

    // Origin-form target ("/path?query") for the request line.
    static std::string request_target(const UrlParsed& parsed);

    static std::string default_port(const std::string& scheme);
};

}  // namespace Utils
}  // namespace Umbra
