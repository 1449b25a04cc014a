#include <utility>
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include "../../src/core/cancellation/cancellation.hpp"
#include "../../src/core/types/constants.hpp"

using namespace Umbra::Core;
namespace net = boost::asio;

TEST(CancellationTest, HandlersFireOnce) {
    CancellationSignal signal;
    int                fired = 0;
    auto               registration = signal.on_cancel([&] { ++fired; });

    signal.cancel();
    signal.cancel();
    EXPECT_EQ(fired, 1);
    EXPECT_TRUE(signal.cancelled());
}

TEST(CancellationTest, LateRegistrationFiresImmediately) {
    CancellationSignal signal;
    signal.cancel();

    bool fired        = false;
    auto registration = signal.on_cancel([&] { fired = true; });
    EXPECT_TRUE(fired);
}

TEST(CancellationTest, ReleasedRegistrationDoesNotFire) {
    CancellationSignal signal;
    bool               fired = false;
    {
        auto registration = signal.on_cancel([&] { fired = true; });
    }
    signal.cancel();
    EXPECT_FALSE(fired);
}

TEST(CancellationTest, SleepCompletes) {
    net::io_context    ioc;
    CancellationSignal signal;
    bool               completed = false;

    net::co_spawn(ioc, cancellable_sleep(std::chrono::milliseconds(10), signal),
                  [&](std::exception_ptr, bool ok) { completed = ok; });
    ioc.run();
    EXPECT_TRUE(completed);
}

TEST(CancellationTest, CancelCutsSleepShort) {
    net::io_context    ioc;
    CancellationSignal signal;
    bool               completed = true;

    net::co_spawn(ioc, cancellable_sleep(std::chrono::hours(1), signal),
                  [&](std::exception_ptr, bool ok) { completed = ok; });
    net::steady_timer trigger(ioc, std::chrono::milliseconds(20));
    trigger.async_wait([&](const boost::system::error_code&) { signal.cancel(); });

    auto started = std::chrono::steady_clock::now();
    ioc.run();
    EXPECT_FALSE(completed);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(CancellationTest, AlreadyCancelledSleepReturnsFalse) {
    net::io_context    ioc;
    CancellationSignal signal;
    signal.cancel();
    bool completed = true;

    net::co_spawn(ioc, cancellable_sleep(std::chrono::milliseconds(0), signal),
                  [&](std::exception_ptr, bool ok) { completed = ok; });
    ioc.run();
    EXPECT_FALSE(completed);
}

TEST(BackoffTest, ScheduleValues) {
    EXPECT_EQ(get_backoff_time(1.0, 1.5, 0).count(), 0);
    EXPECT_EQ(get_backoff_time(1.0, 1.5, 1).count(), 1000);
    EXPECT_EQ(get_backoff_time(1.0, 2.0, 4).count(), 8000);
    EXPECT_EQ(get_backoff_time(0.5, 1.0, 3).count(), 500);
}
