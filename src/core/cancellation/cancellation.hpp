#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace Umbra {
namespace Core {

/**
 * @brief Run-wide cooperative cancellation.
 *
 * Suspended operations (timers, sockets, curl transfers) register a handler
 * that releases them. cancel() fires every registered handler once; handlers
 * registered after cancellation fire immediately.
 */
class CancellationSignal {
public:
    using Handler = std::function<void()>;

    class Registration {
    public:
        Registration() = default;
        Registration(CancellationSignal* signal, std::uint64_t id) : signal_(signal), id_(id) {
        }
        Registration(const Registration&)            = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        ~Registration();

    private:
        CancellationSignal* signal_ = nullptr;
        std::uint64_t       id_     = 0;
    };

    CancellationSignal()                                     = default;
    CancellationSignal(const CancellationSignal&)            = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    [[nodiscard]] Registration on_cancel(Handler handler);
    void                       cancel();
    bool                       cancelled() const {
        return cancelled_.load();
    }

private:
    void remove(std::uint64_t id);

    std::atomic<bool>                  cancelled_{false};
    mutable std::mutex                 mutex_;
    std::uint64_t                      next_id_ = 1;
    std::map<std::uint64_t, Handler>   handlers_;
};

// Waits for `delay` on the current executor. Returns false when the wait was
// cut short by cancellation.
boost::asio::awaitable<bool> cancellable_sleep(std::chrono::milliseconds delay,
                                               CancellationSignal&       signal);

}  // namespace Core
}  // namespace Umbra
