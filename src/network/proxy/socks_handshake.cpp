#include "socks_handshake.hpp"
#include <vector>
#include "../../binary/reader.hpp"
#include "../../binary/writer.hpp"

namespace Umbra::Network::Proxy {

namespace net = boost::asio;
using namespace Umbra::Binary;

namespace {
constexpr uint8_t SOCKS_VERSION      = 0x05;
constexpr uint8_t AUTH_NONE          = 0x00;
constexpr uint8_t AUTH_USER_PASS     = 0x02;
constexpr uint8_t AUTH_NO_ACCEPTABLE = 0xFF;
constexpr uint8_t USER_PASS_VERSION  = 0x01;
constexpr uint8_t CMD_CONNECT        = 0x01;
constexpr uint8_t ATYP_IPV4          = 0x01;
constexpr uint8_t ATYP_DOMAIN        = 0x03;
constexpr uint8_t ATYP_IPV6          = 0x04;

uint16_t parse_port(const std::string& port) {
    try {
        int value = std::stoi(port);
        if (value > 0 && value <= 0xFFFF)
            return static_cast<uint16_t>(value);
    } catch (const std::exception&) {
    }
    throw SocksError(SocksHandshake::GENERAL_FAILURE, "Invalid destination port: " + port);
}
}  // namespace

std::string SocksHandshake::describe_reply(uint8_t reply) {
    switch (reply) {
        case SUCCEEDED: return "succeeded";
        case GENERAL_FAILURE: return "general failure";
        case 0x02: return "connection not allowed by ruleset";
        case NETWORK_UNREACHABLE: return "network unreachable";
        case HOST_UNREACHABLE: return "host unreachable";
        case CONNECTION_REFUSED: return "connection refused";
        case TTL_EXPIRED: return "TTL expired";
        case 0x07: return "command not supported";
        case 0x08: return "address type not supported";
        case 0xF0: return "onion service descriptor not found";
        case 0xF1: return "onion service descriptor invalid";
        case 0xF2: return "onion service introduction failed";
        case 0xF3: return "onion service rendezvous failed";
        case 0xF4: return "onion service missing client authorization";
        case 0xF5: return "onion service wrong client authorization";
        case 0xF6: return "onion service bad address";
        case 0xF7: return "onion service introduction timed out";
        default: return "unknown reply " + std::to_string(reply);
    }
}

net::awaitable<void> SocksHandshake::perform_socks5(boost::beast::tcp_stream& socket,
                                                    const std::string&        host,
                                                    const std::string&        port,
                                                    const SocksCredentials&   credentials) {
    if (host.empty() || host.size() > 0xFF) {
        throw SocksError(GENERAL_FAILURE, "Invalid destination host for SOCKS5");
    }
    uint16_t port_number = parse_port(port);
    bool     use_auth    = !credentials.empty();

    std::vector<uint8_t> greeting;
    Writer               writer(greeting);
    writer.write_uint8(SOCKS_VERSION);
    writer.write_uint8(0x01);
    writer.write_uint8(use_auth ? AUTH_USER_PASS : AUTH_NONE);
    co_await net::async_write(socket, net::buffer(greeting), net::use_awaitable);

    std::vector<uint8_t> choice_data(2);
    co_await             net::async_read(socket, net::buffer(choice_data), net::use_awaitable);

    Reader  reader(choice_data);
    uint8_t version = reader.read_uint8();
    uint8_t method  = reader.read_uint8();
    if (version != SOCKS_VERSION || method == AUTH_NO_ACCEPTABLE
        || method != (use_auth ? AUTH_USER_PASS : AUTH_NONE)) {
        throw SocksError(GENERAL_FAILURE, "SOCKS5 handshake failed (auth choice)");
    }

    if (use_auth) {
        std::vector<uint8_t> auth;
        Writer               auth_writer(auth);
        auth_writer.write_uint8(USER_PASS_VERSION);
        auth_writer.write_short_string(credentials.username);
        auth_writer.write_short_string(credentials.password);
        co_await net::async_write(socket, net::buffer(auth), net::use_awaitable);

        std::vector<uint8_t> auth_reply(2);
        co_await             net::async_read(socket, net::buffer(auth_reply), net::use_awaitable);
        if (auth_reply[1] != 0x00) {
            throw SocksError(GENERAL_FAILURE, "SOCKS5 authentication rejected");
        }
    }

    std::vector<uint8_t> req_data;
    Writer               req_writer(req_data);
    req_writer.write_uint8(SOCKS_VERSION);
    req_writer.write_uint8(CMD_CONNECT);
    req_writer.write_uint8(0x00);
    req_writer.write_uint8(ATYP_DOMAIN);
    req_writer.write_short_string(host);
    req_writer.write_uint16_be(port_number);

    co_await net::async_write(socket, net::buffer(req_data), net::use_awaitable);

    std::vector<uint8_t> header_data(4);
    co_await             net::async_read(socket, net::buffer(header_data), net::use_awaitable);

    Reader header_reader(header_data);
    header_reader.read_uint8();
    uint8_t reply = header_reader.read_uint8();
    if (reply != SUCCEEDED) {
        throw SocksError(reply, "SOCKS5 connect failed: " + describe_reply(reply));
    }
    header_reader.read_uint8();
    uint8_t atyp = header_reader.read_uint8();

    size_t len = 0;
    if (atyp == ATYP_IPV4)
        len = 4;
    else if (atyp == ATYP_DOMAIN) {
        uint8_t  domain_len;
        co_await net::async_read(socket, net::buffer(&domain_len, 1), net::use_awaitable);
        len = domain_len;
    }
    else if (atyp == ATYP_IPV6)
        len = 16;
    else
        throw SocksError(GENERAL_FAILURE, "SOCKS5 reply with unknown address type");

    std::vector<uint8_t> addr_port(len + 2);
    co_await             net::async_read(socket, net::buffer(addr_port), net::use_awaitable);

    co_return;
}

}  // namespace Umbra::Network::Proxy
