#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace Umbra::Network::Proxy {

/**
 * @brief A SOCKS5 negotiation failure.
 *
 * `reply()` is the REP octet from the proxy's CONNECT reply, or
 * GENERAL_FAILURE when negotiation broke before a reply was received.
 */
class SocksError : public std::runtime_error {
public:
    SocksError(uint8_t reply, const std::string& message)
        : std::runtime_error(message), reply_(reply) {
    }
    uint8_t reply() const {
        return reply_;
    }

private:
    uint8_t reply_;
};

struct SocksCredentials {
    std::string username;
    std::string password;

    bool empty() const {
        return username.empty() && password.empty();
    }
};

/**
 * @brief SOCKS5 client handshake (RFC 1928 / RFC 1929).
 *
 * Tor keeps streams with distinct username/password pairs on distinct
 * circuits, so credentials double as an isolation key.
 */
class SocksHandshake {
public:
    static constexpr uint8_t SUCCEEDED             = 0x00;
    static constexpr uint8_t GENERAL_FAILURE       = 0x01;
    static constexpr uint8_t NETWORK_UNREACHABLE   = 0x03;
    static constexpr uint8_t HOST_UNREACHABLE      = 0x04;
    static constexpr uint8_t CONNECTION_REFUSED    = 0x05;
    static constexpr uint8_t TTL_EXPIRED           = 0x06;
    static constexpr uint8_t ONION_ERRORS_FIRST    = 0xF0;
    static constexpr uint8_t ONION_ERRORS_LAST     = 0xF7;

    /**
     * @brief Performs a SOCKS5 CONNECT to host:port using the domain-name
     * address type, so name resolution happens on the proxy side. The
     * stream's expiry bounds the whole negotiation.
     * @throws SocksError on a refused negotiation, boost::system::system_error
     * on I/O failure.
     */
    static boost::asio::awaitable<void> perform_socks5(boost::beast::tcp_stream& stream,
                                                       const std::string&        host,
                                                       const std::string&        port,
                                                       const SocksCredentials&   credentials = {});

    static std::string describe_reply(uint8_t reply);
};

}  // namespace Umbra::Network::Proxy
