#include <utility>
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <map>
#include "../../src/network/tor/control_client.hpp"

using namespace Umbra::Network::Tor;
namespace net = boost::asio;
using tcp     = net::ip::tcp;

namespace {

// Scripted control port: records each command line and answers from `replies`.
net::awaitable<void> fake_control_port(tcp::acceptor&                   acceptor,
                                       std::map<std::string, std::string> replies,
                                       std::vector<std::string>&        commands) {
    tcp::socket socket = co_await acceptor.async_accept(net::use_awaitable);
    std::string buffer;
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await net::async_read_until(
            socket, net::dynamic_buffer(buffer), "\r\n", net::redirect_error(net::use_awaitable, ec));
        if (ec)
            co_return;
        std::string line = buffer.substr(0, n - 2);
        buffer.erase(0, n);
        commands.push_back(line);

        std::string verb  = line.substr(0, line.find(' '));
        std::string reply = replies.count(verb) ? replies[verb] : "250 OK\r\n";
        co_await net::async_write(socket, net::buffer(reply), net::use_awaitable);
        if (verb == "QUIT")
            co_return;
    }
}

template <typename Call>
bool run_against(std::map<std::string, std::string> replies, std::vector<std::string>& commands,
                 const std::string& password, Call call) {
    net::io_context ioc;
    tcp::acceptor   acceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
    int             port = acceptor.local_endpoint().port();

    net::co_spawn(ioc, fake_control_port(acceptor, std::move(replies), commands), net::detached);

    TorControlClient client("127.0.0.1", port, password, std::chrono::milliseconds(2000));
    bool             result = false;
    net::co_spawn(ioc, call(client), [&](std::exception_ptr e, bool ok) {
        if (!e)
            result = ok;
    });
    ioc.run();
    return result;
}

}  // namespace

TEST(TorControlTest, QuotesPasswords) {
    EXPECT_EQ(TorControlClient::quote("plain"), "\"plain\"");
    EXPECT_EQ(TorControlClient::quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
}

TEST(TorControlTest, NewIdentitySendsNewnym) {
    std::vector<std::string> commands;
    bool ok = run_against({}, commands, "secret", [](TorControlClient& c) { return c.signal_new_identity(); });

    EXPECT_TRUE(ok);
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0], "AUTHENTICATE \"secret\"");
    EXPECT_EQ(commands[1], "SIGNAL NEWNYM");
    EXPECT_EQ(commands[2], "QUIT");
}

TEST(TorControlTest, RejectedAuthenticationFails) {
    std::vector<std::string> commands;
    bool ok = run_against({{"AUTHENTICATE", "515 Authentication failed\r\n"}},
                          commands,
                          "wrong",
                          [](TorControlClient& c) { return c.signal_new_identity(); });

    EXPECT_FALSE(ok);
    ASSERT_EQ(commands.size(), 1u);
}

TEST(TorControlTest, ProbeReadsCircuitStatus) {
    std::vector<std::string> commands;
    bool ok = run_against({{"GETINFO", "250-status/circuit-established=1\r\n250 OK\r\n"}},
                          commands,
                          "",
                          [](TorControlClient& c) { return c.probe(); });

    EXPECT_TRUE(ok);
    EXPECT_EQ(commands[0], "AUTHENTICATE");
    EXPECT_EQ(commands[1], "GETINFO status/circuit-established");
}

TEST(TorControlTest, ProbeWithoutCircuitFails) {
    std::vector<std::string> commands;
    bool ok = run_against({{"GETINFO", "250-status/circuit-established=0\r\n250 OK\r\n"}},
                          commands,
                          "",
                          [](TorControlClient& c) { return c.probe(); });
    EXPECT_FALSE(ok);
}

TEST(TorControlTest, UnreachablePortReportsFailure) {
    net::io_context ioc;
    int             port;
    {
        tcp::acceptor probe_port(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
        port = probe_port.local_endpoint().port();
    }
    TorControlClient client("127.0.0.1", port, "", std::chrono::milliseconds(500));
    bool             result = true;
    net::co_spawn(ioc, client.probe(), [&](std::exception_ptr e, bool ok) {
        if (!e)
            result = ok;
    });
    ioc.run();
    EXPECT_FALSE(result);
}
