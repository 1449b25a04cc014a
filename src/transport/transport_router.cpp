#include "transport_router.hpp"
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"

namespace Umbra {
namespace Transport {

namespace net = boost::asio;
using namespace Umbra::Core;
using Network::Http::ErrorType;

std::string TransportError::describe() const {
    if (kind == TransportErrorKind::HttpStatus)
        return "http_status(" + std::to_string(status) + ")";
    if (kind == TransportErrorKind::Unknown && !detail.empty())
        return "unknown(" + detail + ")";
    return to_string(kind);
}

TransportRouter::TransportRouter(Network::Http::HttpClient& primary,
                                 Network::Http::HttpClient* fallback,
                                 Circuit::CircuitManager&   circuits,
                                 TransportSettings          settings)
    : primary_(primary), fallback_(fallback), circuits_(circuits), settings_(settings) {
}

TransportError TransportRouter::classify(const Network::Http::Response& response,
                                         std::size_t                    min_content_length) {
    switch (response.error_type) {
        case ErrorType::None: break;
        case ErrorType::Timeout: return {TransportErrorKind::Timeout, 0, response.error};
        case ErrorType::ConnectionRefused:
            return {TransportErrorKind::ConnectionRefused, 0, response.error};
        case ErrorType::Proxy:
        case ErrorType::Protocol:
        case ErrorType::TooLarge: return {TransportErrorKind::ProtocolError, 0, response.error};
        case ErrorType::Cancelled: return {TransportErrorKind::Unknown, 0, "cancelled"};
        case ErrorType::Network: return {TransportErrorKind::Unknown, 0, response.error};
    }

    if (response.status_code < 200 || response.status_code >= 300)
        return {TransportErrorKind::HttpStatus, response.status_code, response.error};
    if (response.body.size() < min_content_length) {
        return {TransportErrorKind::EmptyBody,
                response.status_code,
                std::to_string(response.body.size()) + " bytes"};
    }
    return {};
}

net::awaitable<FetchResult> TransportRouter::fetch(const Target::Target&            target,
                                                   const Identity::IdentityProfile& identity,
                                                   TransportKind                    transport,
                                                   std::chrono::seconds             timeout,
                                                   CancellationSignal&              cancel) {
    FetchResult result;
    result.transport = transport;

    Network::Http::HttpClient* client = &primary_;
    if (transport == TransportKind::Fallback) {
        if (!fallback_) {
            result.error = {TransportErrorKind::Unknown, 0, "fallback transport disabled"};
            co_return result;
        }
        client = fallback_;
    }

    Network::Http::Request request;
    request.url           = target.normalized;
    request.headers       = identity.headers;
    request.tls_profile   = identity.tls_profile;
    request.timeout       = timeout;
    request.max_body_size = settings_.max_body_size * Constants::BODY_HARD_LIMIT_MULTIPLIER;
    if (transport == TransportKind::Primary) {
        request.isolation = circuits_.isolation_credentials();
        circuits_.record_request();
    }

    auto started  = std::chrono::steady_clock::now();
    auto response = co_await client->get(request, cancel);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    result.cancelled = response.error_type == ErrorType::Cancelled || cancel.cancelled();
    // Past the hard limit the client stops reading; the page is not refetched.
    result.oversized = response.error_type == ErrorType::TooLarge;

    result.error = classify(response, settings_.min_content_length);
    if (result.error.kind != TransportErrorKind::None) {
        Logger::debug("[" + target.short_id() + "] " + to_string(transport)
                      + " attempt failed: " + result.error.describe());
        co_return result;
    }

    result.ok                    = true;
    result.oversized             = response.body.size() > settings_.max_body_size;
    result.document.url          = target.normalized;
    result.document.status_code  = response.status_code;
    result.document.content_type = std::move(response.content_type);
    result.document.body         = std::move(response.body);
    result.document.headers      = std::move(response.headers);
    co_return result;
}

}  // namespace Transport
}  // namespace Umbra
