#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include "../../anomaly/anomaly_sink.hpp"
#include "../../circuit/circuit_manager.hpp"
#include "../../core/cancellation/cancellation.hpp"
#include "../../identity/fingerprint_generator.hpp"
#include "../../retry/retry_policy.hpp"
#include "../../target/target.hpp"
#include "../../transport/transport_router.hpp"

namespace Umbra {
namespace Engine {

struct AttemptContext {
    const Target::Target&     target;
    Retry::RetrySession&      session;
    TransportKind             transport;
    Identity::IdentityProfile identity;
    Core::CancellationSignal& cancel;
    bool                      rotated = false;
};

// before_attempt() runs in list order ahead of the attempt, on_outcome() after it.
class AttemptStage {
public:
    virtual ~AttemptStage() = default;

    virtual boost::asio::awaitable<void> before_attempt(AttemptContext& ctx) = 0;
    virtual void on_outcome(const AttemptContext& ctx, const Transport::FetchResult& result) = 0;
};

// Cadence-driven rotation of the shared circuit ahead of primary attempts.
class CircuitRotationStage : public AttemptStage {
public:
    CircuitRotationStage(Circuit::CircuitManager& circuits, Anomaly::AnomalySink& anomalies);

    boost::asio::awaitable<void> before_attempt(AttemptContext& ctx) override;
    void on_outcome(const AttemptContext&, const Transport::FetchResult&) override {
    }

private:
    Circuit::CircuitManager& circuits_;
    Anomaly::AnomalySink&    anomalies_;
};

// Sleeps for the identity's timing jitter.
class TimingJitterStage : public AttemptStage {
public:
    boost::asio::awaitable<void> before_attempt(AttemptContext& ctx) override;
    void on_outcome(const AttemptContext&, const Transport::FetchResult&) override {
    }
};

// Reports empty 2xx bodies, oversized bodies and slow attempts.
class AnomalyStage : public AttemptStage {
public:
    AnomalyStage(Anomaly::AnomalySink& anomalies, std::chrono::milliseconds slow_threshold);

    boost::asio::awaitable<void> before_attempt(AttemptContext&) override {
        co_return;
    }
    void on_outcome(const AttemptContext& ctx, const Transport::FetchResult& result) override;

private:
    Anomaly::AnomalySink&     anomalies_;
    std::chrono::milliseconds slow_threshold_;
};

}  // namespace Engine
}  // namespace Umbra
