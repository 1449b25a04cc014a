#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include "../network/proxy/socks_handshake.hpp"
#include "../network/tor/control_client.hpp"

namespace Umbra {
namespace Circuit {

struct CircuitConfig {
    int    max_requests_per_circuit    = 10;
    int    min_circuit_lifespan_seconds = 30;
    double random_rotation_probability = 0.2;
    bool   random_rotation_enabled     = true;
    int    hops                        = 3;
};

struct Circuit {
    std::chrono::steady_clock::time_point created_at;
    int                                   request_count = 0;
    int                                   hops          = 3;
    std::uint64_t                         epoch         = 0;
};

enum class RotationResult { Rotated, Skipped, Failed };

struct CircuitStats {
    std::uint64_t rotations = 0;
    std::uint64_t skipped   = 0;
    std::uint64_t failures  = 0;
};

std::string to_string(RotationResult result);

/**
 * @brief Owns the rotation cadence of the shared circuit.
 *
 * All state sits behind one mutex that is never held across the control
 * channel call. rotate() before the minimum lifespan has elapsed, or while
 * another rotation is in flight, is a no-op reported as Skipped.
 */
class CircuitManager {
public:
    using Clock    = std::chrono::steady_clock;
    using ClockFn  = std::function<Clock::time_point()>;
    // Uniform draw in [0, 1).
    using RandomFn = std::function<double()>;

    CircuitManager(CircuitConfig                 config,
                   Network::Tor::CircuitControl& control,
                   ClockFn                       clock  = nullptr,
                   RandomFn                      random = nullptr);

    bool                                     should_rotate(bool after_failure);
    boost::asio::awaitable<RotationResult> rotate();
    void                                     record_request();

    Circuit      snapshot() const;
    CircuitStats stats() const;

    // SOCKS credentials for the current epoch; a successful rotation changes them.
    Network::Proxy::SocksCredentials isolation_credentials() const;

private:
    CircuitConfig                 config_;
    Network::Tor::CircuitControl& control_;
    ClockFn                       clock_;
    RandomFn                      random_;
    std::mt19937_64               rng_;
    std::string                   session_tag_;

    mutable std::mutex mutex_;
    Clock::time_point  last_rotation_;
    int                requests_since_rotation_ = 0;
    std::uint64_t      epoch_                   = 0;
    bool               rotation_in_flight_      = false;
    CircuitStats       stats_;

    bool lifespan_elapsed(Clock::time_point now) const;
};

}  // namespace Circuit
}  // namespace Umbra
