#include "attempt_stages.hpp"
#include "../../core/logger/logger.hpp"

namespace Umbra {
namespace Engine {

namespace net = boost::asio;
using namespace Umbra::Core;

CircuitRotationStage::CircuitRotationStage(Circuit::CircuitManager& circuits,
                                           Anomaly::AnomalySink&    anomalies)
    : circuits_(circuits), anomalies_(anomalies) {
}

net::awaitable<void> CircuitRotationStage::before_attempt(AttemptContext& ctx) {
    if (ctx.transport != TransportKind::Primary || !circuits_.should_rotate(false))
        co_return;

    auto result = co_await circuits_.rotate();
    if (result == Circuit::RotationResult::Rotated) {
        ctx.rotated = true;
    }
    else if (result == Circuit::RotationResult::Failed) {
        anomalies_.report("rotation_failure",
                          {{"target", ctx.target.short_id()}, {"trigger", "cadence"}});
    }
    co_return;
}

net::awaitable<void> TimingJitterStage::before_attempt(AttemptContext& ctx) {
    co_await cancellable_sleep(ctx.identity.jitter, ctx.cancel);
    co_return;
}

AnomalyStage::AnomalyStage(Anomaly::AnomalySink& anomalies, std::chrono::milliseconds slow_threshold)
    : anomalies_(anomalies), slow_threshold_(slow_threshold) {
}

void AnomalyStage::on_outcome(const AttemptContext& ctx, const Transport::FetchResult& result) {
    const std::string id = ctx.target.short_id();
    if (result.error.kind == TransportErrorKind::EmptyBody) {
        anomalies_.report("empty_body",
                          {{"target", id},
                           {"status", std::to_string(result.error.status)},
                           {"size", result.error.detail},
                           {"transport", to_string(result.transport)}});
    }
    if (result.oversized) {
        anomalies_.report("oversized_body",
                          {{"target", id},
                           {"size",
                            result.ok ? std::to_string(result.document.body.size())
                                      : result.error.detail},
                           {"transport", to_string(result.transport)}});
    }
    if (slow_threshold_.count() > 0 && result.elapsed > slow_threshold_) {
        anomalies_.report("slow_attempt",
                          {{"target", id},
                           {"elapsed_ms", std::to_string(result.elapsed.count())},
                           {"transport", to_string(result.transport)}});
    }
}

}  // namespace Engine
}  // namespace Umbra
