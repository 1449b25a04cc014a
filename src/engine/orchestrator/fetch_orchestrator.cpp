#include "fetch_orchestrator.hpp"
#include "../../core/logger/logger.hpp"

namespace Umbra {
namespace Engine {

namespace net = boost::asio;
using namespace Umbra::Core;
using Retry::RetryAction;

namespace {
TargetOutcome& cancelled(TargetOutcome& outcome) {
    outcome.kind   = OutcomeKind::Failed;
    outcome.reason = FailureReason::RunCancelled;
    outcome.detail = "run cancelled";
    return outcome;
}
}  // namespace

FetchOrchestrator::FetchOrchestrator(Identity::FingerprintGenerator& fingerprints,
                                     Transport::TransportRouter&     router,
                                     Retry::RetryPolicy&             policy,
                                     Circuit::CircuitManager&        circuits,
                                     IngestionCoordinator&           ingestion,
                                     Anomaly::AnomalySink&           anomalies,
                                     OrchestratorSettings            settings)
    : fingerprints_(fingerprints),
      router_(router),
      policy_(policy),
      ingestion_(ingestion),
      anomalies_(anomalies),
      settings_(settings),
      rotation_stage_(circuits, anomalies),
      anomaly_stage_(anomalies, settings.slow_attempt),
      stages_{&rotation_stage_, &jitter_stage_, &anomaly_stage_} {
}

net::awaitable<TargetOutcome> FetchOrchestrator::run(const Target::Target& target,
                                                     CancellationSignal&   cancel) {
    TargetOutcome outcome;
    outcome.content_address = target.content_address;
    const std::string id    = target.short_id();

    if (!target.valid) {
        outcome.kind   = OutcomeKind::SkippedInvalid;
        outcome.detail = target.invalid_reason;
        Logger::warn("[" + id + "] Skipping invalid address: " + target.invalid_reason);
        co_return outcome;
    }
    if (cancel.cancelled())
        co_return cancelled(outcome);
    if (ingestion_.is_ingested(target.content_address)) {
        outcome.kind = OutcomeKind::SkippedAlreadyIngested;
        Logger::info("[" + id + "] Already ingested, skipping");
        co_return outcome;
    }

    Retry::RetrySession       session;
    Transport::FetchResult    result;
    std::chrono::milliseconds backoff_before{0};

    for (;;) {
        if (cancel.cancelled())
            co_return cancelled(outcome);

        policy_.begin_attempt(session);
        AttemptContext ctx{target, session, session.transport, fingerprints_.generate(), cancel};
        for (auto* stage : stages_)
            co_await stage->before_attempt(ctx);
        if (ctx.rotated)
            ++outcome.rotations;
        if (cancel.cancelled())
            co_return cancelled(outcome);

        Logger::info("[" + id + "] Fetching via " + to_string(ctx.transport)
                     + (session.retry_ordinal > 0
                            ? " [Retry " + std::to_string(session.retry_ordinal) + "]"
                            : ""));

        auto timeout = ctx.transport == TransportKind::Primary ? settings_.request_timeout
                                                               : settings_.fallback_timeout;
        result = co_await router_.fetch(target, ctx.identity, ctx.transport, timeout, cancel);
        for (auto* stage : stages_)
            stage->on_outcome(ctx, result);

        outcome.attempts.push_back(AttemptRecord{.transport      = ctx.transport,
                                                 .retry_ordinal  = session.retry_ordinal,
                                                 .ok             = result.ok,
                                                 .error          = result.error,
                                                 .elapsed        = result.elapsed,
                                                 .backoff_before = backoff_before});
        if (result.cancelled && cancel.cancelled())
            co_return cancelled(outcome);

        auto decision = policy_.decide(session, result);
        if (decision.action == RetryAction::Succeed)
            break;

        if (decision.action == RetryAction::Abandon) {
            outcome.kind   = OutcomeKind::Failed;
            outcome.reason = decision.reason;
            outcome.detail = session.last_error.describe();
            Logger::error("[" + id + "] Giving up: " + to_string(decision.reason) + " ("
                          + outcome.detail + ")");
            co_return outcome;
        }

        ++outcome.retries;
        if (decision.rotate) {
            auto rotation = co_await policy_.rotate_after_failure();
            if (rotation == Circuit::RotationResult::Rotated) {
                ++outcome.rotations;
            }
            else if (rotation == Circuit::RotationResult::Failed) {
                anomalies_.report("rotation_failure",
                                  {{"target", id}, {"trigger", session.last_error.describe()}});
            }
        }
        if (decision.next_transport == TransportKind::Fallback && !outcome.escalated) {
            outcome.escalated = true;
            Logger::warn("[" + id + "] Escalating to fallback transport");
        }

        backoff_before = decision.backoff;
        if (!co_await cancellable_sleep(decision.backoff, cancel))
            co_return cancelled(outcome);
    }

    co_await finish_ingest(target, result.document, outcome);
    co_return outcome;
}

net::awaitable<void> FetchOrchestrator::finish_ingest(const Target::Target&         target,
                                                      const Transport::RawDocument& document,
                                                      TargetOutcome&                outcome) {
    IngestResult ingested;
    bool         failed = false;
    std::string  error;
    try {
        ingested = co_await ingestion_.ingest(target, document);
    } catch (const std::exception& e) {
        failed = true;
        error  = e.what();
    }
    if (failed) {
        Logger::error("[" + target.short_id() + "] Ingestion error: " + Logger::redact(error));
        ingested = IngestResult{IngestStatus::StorageFailed, 0, error};
    }

    switch (ingested.status) {
        case IngestStatus::Stored:
            outcome.kind   = OutcomeKind::Ingested;
            outcome.chunks = ingested.chunks;
            break;
        case IngestStatus::AlreadyIngested: outcome.kind = OutcomeKind::SkippedAlreadyIngested; break;
        case IngestStatus::EmptyContent:
            outcome.kind   = OutcomeKind::Failed;
            outcome.reason = FailureReason::EmptyContent;
            outcome.detail = ingested.error;
            break;
        case IngestStatus::StorageFailed:
            outcome.kind   = OutcomeKind::Failed;
            outcome.reason = FailureReason::StorageFailed;
            outcome.detail = Logger::redact(ingested.error);
            break;
    }
    co_return;
}

}  // namespace Engine
}  // namespace Umbra
