#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../utils/url/url.hpp"
#include "http_client.hpp"

namespace Umbra {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    explicit BeastClient(boost::asio::io_context& ioc);
    ~BeastClient() override = default;

    // Accepts socks5:// and socks5h:// endpoints; an empty string connects directly.
    void set_proxy(const std::string& proxy) override;
    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const Request&            request,
                                         Core::CancellationSignal& cancel) override;

    static ErrorType classify(const boost::system::error_code& ec);
    static ErrorType classify_socks_reply(uint8_t reply);

private:
    std::string               proxy_host_;
    std::string               proxy_port_;
    std::chrono::milliseconds connect_timeout_{30000};
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Response> perform_http_request(const Request&            request,
                                                          const Utils::UrlParsed&   parsed,
                                                          Core::CancellationSignal& cancel);
    boost::asio::awaitable<Response> perform_https_request(const Request&            request,
                                                           const Utils::UrlParsed&   parsed,
                                                           Core::CancellationSignal& cancel);
    boost::asio::awaitable<void> open_tunnel(boost::beast::tcp_stream& stream,
                                             const Request&            request,
                                             const std::string&        host,
                                             const std::string&        port);
};

}  // namespace Http
}  // namespace Network
}  // namespace Umbra
