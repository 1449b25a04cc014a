#include "retry_policy.hpp"
#include "../core/types/constants.hpp"

namespace Umbra {
namespace Retry {

namespace net = boost::asio;
using Transport::TransportError;

std::string to_string(RetryState state) {
    switch (state) {
        case RetryState::Pending: return "pending";
        case RetryState::Attempting: return "attempting";
        case RetryState::Succeeded: return "succeeded";
        case RetryState::Retrying: return "retrying";
        case RetryState::Escalating: return "escalating";
        case RetryState::Abandoned: return "abandoned";
    }
    return "unknown";
}

RetryPolicy::RetryPolicy(RetryConfig config, Circuit::CircuitManager& circuits)
    : config_(config), circuits_(circuits) {
}

bool RetryPolicy::is_retryable(const TransportError& error) {
    switch (error.kind) {
        case TransportErrorKind::None: return false;
        case TransportErrorKind::HttpStatus:
            return error.status >= 500 || error.status == 408 || error.status == 429;
        default: return true;
    }
}

bool RetryPolicy::triggers_rotation(const TransportError& error) {
    switch (error.kind) {
        case TransportErrorKind::Timeout:
        case TransportErrorKind::ConnectionRefused:
        case TransportErrorKind::ProtocolError: return true;
        case TransportErrorKind::HttpStatus:
            switch (error.status) {
                case 500:
                case 502:
                case 503:
                case 504:
                case 408:
                case 429: return true;
                default: return false;
            }
        default: return false;
    }
}

std::chrono::milliseconds RetryPolicy::backoff_for(int ordinal) const {
    return Core::get_backoff_time(config_.backoff_base_seconds, config_.backoff_factor, ordinal);
}

void RetryPolicy::begin_attempt(RetrySession& session) const {
    session.state = RetryState::Attempting;
}

RetryDecision RetryPolicy::decide(RetrySession&                 session,
                                  const Transport::FetchResult& result) const {
    RetryDecision decision;
    if (result.ok) {
        session.state          = RetryState::Succeeded;
        decision.action        = RetryAction::Succeed;
        decision.next_transport = session.transport;
        return decision;
    }

    session.last_error = result.error;
    if (result.oversized) {
        session.state   = RetryState::Abandoned;
        decision.action = RetryAction::Abandon;
        decision.reason = FailureReason::OversizedBody;
        return decision;
    }
    if (!is_retryable(result.error)) {
        session.state   = RetryState::Abandoned;
        decision.action = RetryAction::Abandon;
        decision.reason = FailureReason::NonRetryableStatus;
        return decision;
    }

    session.retry_ordinal += 1;
    if (session.retry_ordinal > config_.max_retries) {
        // The ordinal never reports beyond the configured maximum.
        session.retry_ordinal = config_.max_retries;
        session.state         = RetryState::Abandoned;
        decision.action       = RetryAction::Abandon;
        decision.reason       = FailureReason::TransportExhausted;
        return decision;
    }

    decision.action  = RetryAction::Retry;
    decision.rotate  = triggers_rotation(result.error);
    decision.backoff = backoff_for(session.retry_ordinal);
    if (session.retry_ordinal > config_.escalation_retry_threshold && config_.fallback_enabled) {
        session.transport = TransportKind::Fallback;
        session.state     = RetryState::Escalating;
    }
    else {
        session.state = RetryState::Retrying;
    }
    decision.next_transport = session.transport;
    return decision;
}

net::awaitable<Circuit::RotationResult> RetryPolicy::rotate_after_failure() {
    if (!circuits_.should_rotate(true))
        co_return Circuit::RotationResult::Skipped;
    co_return co_await circuits_.rotate();
}

}  // namespace Retry
}  // namespace Umbra
