#include "circuit_manager.hpp"
#include <iomanip>
#include <sstream>
#include "../core/logger/logger.hpp"

namespace Umbra {
namespace Circuit {

namespace net = boost::asio;
using namespace Umbra::Core;

std::string to_string(RotationResult result) {
    switch (result) {
        case RotationResult::Rotated: return "rotated";
        case RotationResult::Skipped: return "skipped";
        case RotationResult::Failed: return "failed";
    }
    return "unknown";
}

namespace {
std::uint64_t seed_value() {
    try {
        std::random_device device;
        return (static_cast<std::uint64_t>(device()) << 32) | device();
    } catch (const std::exception& e) {
        Logger::warn("Randomness source unavailable, seeding from clock: " + std::string(e.what()));
        return static_cast<std::uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
    }
}
}  // namespace

CircuitManager::CircuitManager(CircuitConfig                 config,
                               Network::Tor::CircuitControl& control,
                               ClockFn                       clock,
                               RandomFn                      random)
    : config_(config),
      control_(control),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
      random_(std::move(random)),
      rng_(seed_value()) {
    if (!random_) {
        random_ = [this] {
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(rng_);
        };
    }
    std::ostringstream tag;
    tag << std::hex << std::setw(8) << std::setfill('0') << (rng_() & 0xFFFFFFFFu);
    session_tag_   = tag.str();
    last_rotation_ = clock_();
}

bool CircuitManager::lifespan_elapsed(Clock::time_point now) const {
    return now - last_rotation_ >= std::chrono::seconds(config_.min_circuit_lifespan_seconds);
}

bool CircuitManager::should_rotate(bool after_failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_since_rotation_ >= config_.max_requests_per_circuit)
        return true;
    if (after_failure)
        return true;
    if (!config_.random_rotation_enabled || !lifespan_elapsed(clock_()))
        return false;
    return random_() < config_.random_rotation_probability;
}

net::awaitable<RotationResult> CircuitManager::rotate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rotation_in_flight_ || !lifespan_elapsed(clock_())) {
            ++stats_.skipped;
            Logger::debug("Circuit rotation skipped (lifespan floor)");
            co_return RotationResult::Skipped;
        }
        rotation_in_flight_ = true;
    }

    bool ok = co_await control_.signal_new_identity();

    std::lock_guard<std::mutex> lock(mutex_);
    rotation_in_flight_ = false;
    if (!ok) {
        ++stats_.failures;
        Logger::warn("Circuit rotation failed; continuing on current circuit");
        co_return RotationResult::Failed;
    }
    last_rotation_           = clock_();
    requests_since_rotation_ = 0;
    ++epoch_;
    ++stats_.rotations;
    Logger::info("Circuit rotated (epoch " + std::to_string(epoch_) + ")");
    co_return RotationResult::Rotated;
}

void CircuitManager::record_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++requests_since_rotation_;
}

Circuit CircuitManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Circuit{.created_at    = last_rotation_,
                   .request_count = requests_since_rotation_,
                   .hops          = config_.hops,
                   .epoch         = epoch_};
}

CircuitStats CircuitManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

Network::Proxy::SocksCredentials CircuitManager::isolation_credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {.username = "umbra-" + session_tag_, .password = "epoch-" + std::to_string(epoch_)};
}

}  // namespace Circuit
}  // namespace Umbra
