#include "cancellation.hpp"
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <vector>

namespace Umbra {
namespace Core {

namespace net = boost::asio;

CancellationSignal::Registration::Registration(Registration&& other) noexcept
    : signal_(other.signal_), id_(other.id_) {
    other.signal_ = nullptr;
}

CancellationSignal::Registration&
CancellationSignal::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        if (signal_)
            signal_->remove(id_);
        signal_       = other.signal_;
        id_           = other.id_;
        other.signal_ = nullptr;
    }
    return *this;
}

CancellationSignal::Registration::~Registration() {
    if (signal_)
        signal_->remove(id_);
}

CancellationSignal::Registration CancellationSignal::on_cancel(Handler handler) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            std::uint64_t id = next_id_++;
            handlers_.emplace(id, std::move(handler));
            return Registration(this, id);
        }
    }
    handler();
    return Registration();
}

void CancellationSignal::cancel() {
    std::vector<Handler> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true))
            return;
        for (auto& [id, handler] : handlers_)
            pending.push_back(std::move(handler));
        handlers_.clear();
    }
    for (auto& handler : pending)
        handler();
}

void CancellationSignal::remove(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

net::awaitable<bool> cancellable_sleep(std::chrono::milliseconds delay,
                                       CancellationSignal&       signal) {
    if (signal.cancelled())
        co_return false;
    if (delay.count() <= 0)
        co_return true;

    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(delay);
    auto registration = signal.on_cancel([&timer]() { timer.cancel(); });

    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    co_return !signal.cancelled();
}

}  // namespace Core
}  // namespace Umbra
