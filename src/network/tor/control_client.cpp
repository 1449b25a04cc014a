#include "control_client.hpp"
#include <stdexcept>
#include "../../core/logger/logger.hpp"

namespace Umbra {
namespace Network {
namespace Tor {

namespace net   = boost::asio;
namespace beast = boost::beast;
using tcp       = net::ip::tcp;
using Umbra::Core::Logger;

namespace {
constexpr int         REPLY_OK         = 250;
constexpr std::size_t MAX_REPLY_BYTES  = 64 * 1024;
}  // namespace

TorControlClient::TorControlClient(std::string               host,
                                   int                       port,
                                   std::string               password,
                                   std::chrono::milliseconds timeout)
    : host_(std::move(host)),
      port_(std::to_string(port)),
      password_(std::move(password)),
      timeout_(timeout) {
}

std::string TorControlClient::quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

net::awaitable<ControlReply> TorControlClient::read_reply(beast::tcp_stream& stream,
                                                          std::string&       buffer) {
    ControlReply reply;
    for (;;) {
        std::size_t n = co_await net::async_read_until(
            stream, net::dynamic_buffer(buffer, MAX_REPLY_BYTES), "\r\n", net::use_awaitable);
        std::string line = buffer.substr(0, n - 2);
        buffer.erase(0, n);

        if (line.size() < 4)
            throw std::runtime_error("Malformed control reply line");
        int status = std::stoi(line.substr(0, 3));
        reply.status = status;
        reply.lines.push_back(line.substr(4));

        char separator = line[3];
        if (separator == ' ')
            break;
        if (separator == '+') {
            // Data reply: runs until a line holding a single ".".
            for (;;) {
                std::size_t m = co_await net::async_read_until(
                    stream, net::dynamic_buffer(buffer, MAX_REPLY_BYTES), "\r\n",
                    net::use_awaitable);
                std::string data = buffer.substr(0, m - 2);
                buffer.erase(0, m);
                if (data == ".")
                    break;
                reply.lines.push_back(data);
            }
        }
        else if (separator != '-') {
            throw std::runtime_error("Malformed control reply separator");
        }
    }
    co_return reply;
}

net::awaitable<std::vector<ControlReply>> TorControlClient::session(
    const std::vector<std::string>& commands) {
    auto          executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto          results = co_await resolver.async_resolve(host_, port_, net::use_awaitable);

    beast::tcp_stream stream(executor);
    stream.expires_after(timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    std::string               buffer;
    std::vector<ControlReply> replies;

    std::string auth = password_.empty() ? "AUTHENTICATE\r\n"
                                         : "AUTHENTICATE " + quote(password_) + "\r\n";
    co_await net::async_write(stream, net::buffer(auth), net::use_awaitable);
    ControlReply auth_reply = co_await read_reply(stream, buffer);
    if (auth_reply.status != REPLY_OK) {
        throw std::runtime_error("Control port authentication rejected ("
                                 + std::to_string(auth_reply.status) + ")");
    }

    for (const auto& command : commands) {
        std::string line = command + "\r\n";
        co_await net::async_write(stream, net::buffer(line), net::use_awaitable);
        replies.push_back(co_await read_reply(stream, buffer));
    }

    std::string quit = "QUIT\r\n";
    co_await net::async_write(stream, net::buffer(quit), net::use_awaitable);
    try {
        co_await read_reply(stream, buffer);
    } catch (const boost::system::system_error& e) {
        Logger::debug("Control port closed before QUIT reply: " + e.code().message());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return replies;
}

net::awaitable<bool> TorControlClient::signal_new_identity() {
    try {
        const std::vector<std::string> commands{"SIGNAL NEWNYM"};
        auto replies = co_await session(commands);
        if (replies.empty() || replies.front().status != REPLY_OK) {
            Logger::warn("Control port refused NEWNYM");
            co_return false;
        }
        co_return true;
    } catch (const std::exception& e) {
        Logger::warn("NEWNYM failed: " + std::string(e.what()));
        co_return false;
    }
}

net::awaitable<bool> TorControlClient::probe() {
    try {
        const std::vector<std::string> commands{"GETINFO status/circuit-established"};
        auto replies = co_await session(commands);
        if (replies.empty() || replies.front().status != REPLY_OK) {
            Logger::warn("Control port refused GETINFO");
            co_return false;
        }
        for (const auto& line : replies.front().lines) {
            if (line == "status/circuit-established=1")
                co_return true;
        }
        Logger::warn("Overlay client has no established circuit");
        co_return false;
    } catch (const std::exception& e) {
        Logger::warn("Control channel probe failed: " + std::string(e.what()));
        co_return false;
    }
}

}  // namespace Tor
}  // namespace Network
}  // namespace Umbra
