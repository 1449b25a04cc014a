#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>
#include <umbra/statuses.hpp>
#include "../circuit/circuit_manager.hpp"
#include "../transport/transport_router.hpp"

namespace Umbra {
namespace Retry {

struct RetryConfig {
    int    max_retries                = 3;
    double backoff_factor             = 1.5;
    double backoff_base_seconds       = 1.0;
    int    escalation_retry_threshold = 2;
    bool   fallback_enabled           = true;
};

enum class RetryState { Pending, Attempting, Succeeded, Retrying, Escalating, Abandoned };

std::string to_string(RetryState state);

enum class RetryAction { Succeed, Retry, Abandon };

struct RetryDecision {
    RetryAction               action = RetryAction::Retry;
    bool                      rotate = false;
    std::chrono::milliseconds backoff{0};
    TransportKind             next_transport = TransportKind::Primary;
    FailureReason             reason         = FailureReason::None;
};

// Per-Target state; owned by exactly one orchestrator run.
struct RetrySession {
    RetryState                state         = RetryState::Pending;
    int                       retry_ordinal = 0;
    TransportKind             transport     = TransportKind::Primary;
    Transport::TransportError last_error;
};

class RetryPolicy {
public:
    RetryPolicy(RetryConfig config, Circuit::CircuitManager& circuits);

    void          begin_attempt(RetrySession& session) const;
    RetryDecision decide(RetrySession& session, const Transport::FetchResult& result) const;

    // Rotation after a qualifying failure. Best-effort: a failed rotation is
    // reported and the retry proceeds on the current circuit.
    boost::asio::awaitable<Circuit::RotationResult> rotate_after_failure();

    // Delay before retry `ordinal` (1-based).
    std::chrono::milliseconds backoff_for(int ordinal) const;

    static bool is_retryable(const Transport::TransportError& error);
    static bool triggers_rotation(const Transport::TransportError& error);

    const RetryConfig& config() const {
        return config_;
    }

private:
    RetryConfig              config_;
    Circuit::CircuitManager& circuits_;
};

}  // namespace Retry
}  // namespace Umbra
