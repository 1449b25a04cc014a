#include "beast_client.hpp"
#include <openssl/err.h>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../proxy/socks_handshake.hpp"

namespace Umbra {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;
using Umbra::Core::Logger;

namespace {

Response error_response(const std::string& url, ErrorType type, const std::string& message) {
    Response response;
    response.effective_url = url;
    response.success       = false;
    response.error         = message;
    response.error_type    = type;
    return response;
}

template <typename Stream>
net::awaitable<Response> exchange(Stream&            stream,
                                  const Request&     request,
                                  const std::string& host,
                                  const std::string& target) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    if (request.max_body_size > 0)
        parser.body_limit(request.max_body_size);
    else
        parser.body_limit(boost::none);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    auto&    res = parser.get();
    Response response;
    response.effective_url = request.url;
    response.status_code   = res.result_int();
    response.body          = std::move(res.body());
    response.success       = response.status_code >= 200 && response.status_code < 300;
    for (const auto& field : res) {
        response.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    co_return response;
}

}  // namespace

BeastClient::BeastClient(net::io_context& /*ioc*/) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_proxy(const std::string& proxy) {
    if (proxy.empty()) {
        proxy_host_.clear();
        proxy_port_.clear();
        return;
    }
    auto parsed = Utils::Url::parse(proxy);
    if ((parsed.scheme != "socks5" && parsed.scheme != "socks5h") || parsed.host.empty()) {
        throw std::runtime_error("Primary transport requires a socks5:// proxy, got: " + proxy);
    }
    proxy_host_ = parsed.host;
    proxy_port_ = parsed.port.empty() ? "1080" : parsed.port;
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

ErrorType BeastClient::classify(const boost::system::error_code& ec) {
    if (ec == beast::error::timeout)
        return ErrorType::Timeout;
    if (ec == net::error::connection_refused)
        return ErrorType::ConnectionRefused;
    if (ec == http::error::body_limit)
        return ErrorType::TooLarge;
    if (ec.category() == http::make_error_code(http::error::end_of_stream).category())
        return ErrorType::Protocol;
    if (ec.category() == net::error::get_ssl_category() || ec == net::ssl::error::stream_truncated)
        return ErrorType::Protocol;
    if (ec == net::error::eof || ec == net::error::connection_reset)
        return ErrorType::Protocol;
    return ErrorType::Network;
}

ErrorType BeastClient::classify_socks_reply(uint8_t reply) {
    using Proxy::SocksHandshake;
    if (reply == SocksHandshake::TTL_EXPIRED)
        return ErrorType::Timeout;
    if (reply == SocksHandshake::CONNECTION_REFUSED || reply == SocksHandshake::HOST_UNREACHABLE
        || reply == SocksHandshake::NETWORK_UNREACHABLE
        || (reply >= SocksHandshake::ONION_ERRORS_FIRST
            && reply <= SocksHandshake::ONION_ERRORS_LAST))
        return ErrorType::ConnectionRefused;
    return ErrorType::Proxy;
}

net::awaitable<Response> BeastClient::get(const Request& request, Core::CancellationSignal& cancel) {
    auto parsed = Utils::Url::parse(request.url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        co_return error_response(request.url, ErrorType::Protocol, "Invalid URL");
    }
    if (cancel.cancelled()) {
        co_return error_response(request.url, ErrorType::Cancelled, "Cancelled before start");
    }

    try {
        if (parsed.scheme == "https")
            co_return co_await perform_https_request(request, parsed, cancel);
        co_return co_await perform_http_request(request, parsed, cancel);
    } catch (const Proxy::SocksError& e) {
        co_return error_response(request.url, classify_socks_reply(e.reply()), e.what());
    } catch (const boost::system::system_error& e) {
        ErrorType type = cancel.cancelled() ? ErrorType::Cancelled : classify(e.code());
        co_return error_response(request.url, type, e.code().message());
    } catch (const std::exception& e) {
        co_return error_response(request.url, ErrorType::Network, e.what());
    }
}

net::awaitable<void> BeastClient::open_tunnel(beast::tcp_stream& stream,
                                              const Request&     request,
                                              const std::string& host,
                                              const std::string& port) {
    bool        use_proxy    = !proxy_host_.empty();
    std::string connect_host = use_proxy ? proxy_host_ : host;
    std::string connect_port = use_proxy ? proxy_port_ : port;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);

    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(request.timeout);
    if (use_proxy) {
        co_await Proxy::SocksHandshake::perform_socks5(stream, host, port, request.isolation);
    }
    co_return;
}

net::awaitable<Response> BeastClient::perform_http_request(const Request&            request,
                                                           const Utils::UrlParsed&   parsed,
                                                           Core::CancellationSignal& cancel) {
    std::string port = parsed.port.empty() ? Utils::Url::default_port(parsed.scheme) : parsed.port;

    beast::tcp_stream stream(co_await net::this_coro::executor);
    auto              registration = cancel.on_cancel([&stream] { stream.close(); });

    co_await open_tunnel(stream, request, parsed.host, port);
    Response response =
        co_await exchange(stream, request, parsed.host, Utils::Url::request_target(parsed));

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const Request&            request,
                                                            const Utils::UrlParsed&   parsed,
                                                            Core::CancellationSignal& cancel) {
    std::string port = parsed.port.empty() ? Utils::Url::default_port(parsed.scheme) : parsed.port;

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    auto&                                lowest = beast::get_lowest_layer(ssl_stream);
    auto registration = cancel.on_cancel([&lowest] { lowest.close(); });

    SSL* native = ssl_stream.native_handle();
    if (!SSL_set_tlsext_host_name(native, parsed.host.c_str())
        || !SSL_set_cipher_list(native, Identity::cipher_list(request.tls_profile))
        || !SSL_set1_groups_list(native, Identity::groups_list(request.tls_profile))) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }
    // Onion addresses are self-authenticating; their certificates are
    // almost always self-signed.
    if (Utils::Text::ends_with(parsed.host, Core::Constants::ONION_SUFFIX))
        ssl_stream.set_verify_mode(ssl::verify_none);
    else
        ssl_stream.set_verify_callback(ssl::host_name_verification(parsed.host));

    co_await open_tunnel(lowest, request, parsed.host, port);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    Response response =
        co_await exchange(ssl_stream, request, parsed.host, Utils::Url::request_target(parsed));

    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::ssl::error::stream_truncated)
        Logger::debug("TLS shutdown: " + ec.message());
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Umbra
