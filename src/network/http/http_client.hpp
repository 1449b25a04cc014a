#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "../../core/cancellation/cancellation.hpp"
#include "../../identity/tls_profile.hpp"
#include "../proxy/socks_handshake.hpp"

namespace Umbra {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Timeout, ConnectionRefused, Protocol, TooLarge, Cancelled };

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct Request {
    std::string                url;
    HeaderList                 headers;
    Identity::TlsProfile       tls_profile = Identity::TlsProfile::Firefox102;
    std::chrono::seconds       timeout{60};
    Proxy::SocksCredentials    isolation;
    // 0 disables the limit.
    std::size_t                max_body_size = 0;
};

struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string body;
    HeaderList  headers;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;
};

// Transport problems are reported in Response::error_type, never thrown.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_proxy(const std::string& proxy) = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual boost::asio::awaitable<Response> get(const Request&            request,
                                                 Core::CancellationSignal& cancel) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Umbra
