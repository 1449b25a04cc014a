#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>
#include <vector>
#include <umbra/statuses.hpp>
#include "../ingestion/ingestion_coordinator.hpp"
#include "attempt_stages.hpp"

namespace Umbra {
namespace Engine {

struct AttemptRecord {
    TransportKind             transport     = TransportKind::Primary;
    int                       retry_ordinal = 0;
    bool                      ok            = false;
    Transport::TransportError error;
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds backoff_before{0};
};

struct TargetOutcome {
    OutcomeKind                kind   = OutcomeKind::Failed;
    FailureReason              reason = FailureReason::None;
    std::string                content_address;
    std::string                detail;
    std::size_t                chunks    = 0;
    int                        retries   = 0;
    int                        rotations = 0;
    bool                       escalated = false;
    std::vector<AttemptRecord> attempts;
};

struct OrchestratorSettings {
    std::chrono::seconds      request_timeout{60};
    std::chrono::seconds      fallback_timeout{120};
    std::chrono::milliseconds slow_attempt{45000};
};

class FetchOrchestrator {
public:
    FetchOrchestrator(Identity::FingerprintGenerator& fingerprints,
                      Transport::TransportRouter&     router,
                      Retry::RetryPolicy&             policy,
                      Circuit::CircuitManager&        circuits,
                      IngestionCoordinator&           ingestion,
                      Anomaly::AnomalySink&           anomalies,
                      OrchestratorSettings            settings);

    boost::asio::awaitable<TargetOutcome> run(const Target::Target&     target,
                                              Core::CancellationSignal& cancel);

private:
    Identity::FingerprintGenerator& fingerprints_;
    Transport::TransportRouter&     router_;
    Retry::RetryPolicy&             policy_;
    IngestionCoordinator&           ingestion_;
    Anomaly::AnomalySink&           anomalies_;
    OrchestratorSettings            settings_;

    CircuitRotationStage       rotation_stage_;
    TimingJitterStage          jitter_stage_;
    AnomalyStage               anomaly_stage_;
    std::vector<AttemptStage*> stages_;

    boost::asio::awaitable<void> finish_ingest(const Target::Target&         target,
                                               const Transport::RawDocument& document,
                                               TargetOutcome&                outcome);
};

}  // namespace Engine
}  // namespace Umbra
