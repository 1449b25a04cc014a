#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace Umbra {
namespace Network {
namespace Tor {

// Both calls report failure as false.
class CircuitControl {
public:
    virtual ~CircuitControl() = default;

    // Asks the overlay client to use fresh circuits for new streams.
    virtual boost::asio::awaitable<bool> signal_new_identity() = 0;

    // True when the control channel answers and a circuit is established.
    virtual boost::asio::awaitable<bool> probe() = 0;
};

struct ControlReply {
    int                      status = 0;
    std::vector<std::string> lines;
};

class TorControlClient : public CircuitControl {
public:
    TorControlClient(std::string host, int port, std::string password,
                     std::chrono::milliseconds timeout);

    boost::asio::awaitable<bool> signal_new_identity() override;
    boost::asio::awaitable<bool> probe() override;

    // Quotes a value as a control-protocol QuotedString.
    static std::string quote(const std::string& value);

private:
    std::string               host_;
    std::string               port_;
    std::string               password_;
    std::chrono::milliseconds timeout_;

    boost::asio::awaitable<std::vector<ControlReply>> session(
        const std::vector<std::string>& commands);
    static boost::asio::awaitable<ControlReply> read_reply(boost::beast::tcp_stream& stream,
                                                           std::string&              buffer);
};

}  // namespace Tor
}  // namespace Network
}  // namespace Umbra
