#include <gtest/gtest.h>
#include "../../src/engine/orchestrator/fetch_orchestrator.hpp"
#include "../../src/pipeline/html_content_processor.hpp"
#include "fakes.hpp"

using namespace Umbra;
using namespace Umbra::Engine;
using namespace UmbraTest;

namespace {

class OrchestratorTest : public ::testing::Test {
protected:
    FakeCircuitControl            control_;
    ManualClock                   clock_;
    ScriptedHttpClient            primary_;
    ScriptedHttpClient            fallback_;
    MemoryDocumentStore           store_;
    RecordingAnomalySink          anomalies_;
    Pipeline::HtmlContentProcessor processor_{Pipeline::TextChunker(1000, 200)};
    Core::CancellationSignal      cancel_;

    Identity::FingerprintGenerator           fingerprints_{std::chrono::milliseconds(0)};
    std::unique_ptr<Circuit::CircuitManager> circuits_;
    std::unique_ptr<Transport::TransportRouter> router_;
    std::unique_ptr<Retry::RetryPolicy>      policy_;
    std::unique_ptr<IngestionCoordinator>    ingestion_;
    std::unique_ptr<FetchOrchestrator>       orchestrator_;

    void build(int max_retries = 3, int threshold = 2, bool with_fallback = true) {
        circuits_ = std::make_unique<Circuit::CircuitManager>(
            Circuit::CircuitConfig{.max_requests_per_circuit     = 10,
                                   .min_circuit_lifespan_seconds = 30,
                                   .random_rotation_enabled      = false},
            control_,
            clock_.fn());
        clock_.advance(std::chrono::seconds(31));
        router_ = std::make_unique<Transport::TransportRouter>(
            primary_, with_fallback ? &fallback_ : nullptr, *circuits_, Transport::TransportSettings{});
        policy_ = std::make_unique<Retry::RetryPolicy>(
            Retry::RetryConfig{.max_retries                = max_retries,
                               .backoff_factor             = 1.5,
                               .backoff_base_seconds       = 0.0,
                               .escalation_retry_threshold = threshold,
                               .fallback_enabled           = with_fallback},
            *circuits_);
        ingestion_    = std::make_unique<IngestionCoordinator>(processor_, store_, anomalies_);
        orchestrator_ = std::make_unique<FetchOrchestrator>(fingerprints_,
                                                            *router_,
                                                            *policy_,
                                                            *circuits_,
                                                            *ingestion_,
                                                            anomalies_,
                                                            OrchestratorSettings{});
    }

    TargetOutcome run(const std::string& raw) {
        Target::Target target = Target::Target::from_raw(raw);
        return run_sync(orchestrator_->run(target, cancel_));
    }
};

}  // namespace

TEST_F(OrchestratorTest, FirstAttemptSuccessIngests) {
    build();
    auto outcome = run(onion('a'));

    EXPECT_EQ(outcome.kind, OutcomeKind::Ingested);
    EXPECT_EQ(outcome.retries, 0);
    EXPECT_EQ(outcome.rotations, 0);
    EXPECT_GT(outcome.chunks, 0u);
    EXPECT_EQ(outcome.attempts.size(), 1u);
    EXPECT_EQ(store_.documents(), 1u);
    EXPECT_EQ(control_.newnym_calls, 0);
}

TEST_F(OrchestratorTest, TransientFailuresEscalateThenSucceed) {
    primary_.push(status_response(503));
    build(3, 2);

    Target::Target target = Target::Target::from_raw(onion('b'));
    auto           outcome = run_sync(orchestrator_->run(target, cancel_));

    EXPECT_EQ(outcome.kind, OutcomeKind::Ingested);
    EXPECT_EQ(outcome.retries, 3);
    EXPECT_TRUE(outcome.escalated);
    ASSERT_EQ(outcome.attempts.size(), 4u);
    EXPECT_EQ(outcome.attempts[0].transport, TransportKind::Primary);
    EXPECT_EQ(outcome.attempts[2].transport, TransportKind::Primary);
    EXPECT_EQ(outcome.attempts[3].transport, TransportKind::Fallback);
    EXPECT_EQ(outcome.attempts[3].retry_ordinal, 3);
    // The lifespan floor allows exactly one rotation within the run.
    EXPECT_EQ(outcome.rotations, 1);
    EXPECT_EQ(control_.newnym_calls, 1);
}

TEST_F(OrchestratorTest, NonRetryableStatusFailsWithoutRetry) {
    primary_.push(status_response(404));
    build();

    auto outcome = run(onion('c'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
    EXPECT_EQ(outcome.reason, FailureReason::NonRetryableStatus);
    EXPECT_EQ(outcome.detail, "http_status(404)");
    EXPECT_EQ(outcome.attempts.size(), 1u);
    EXPECT_EQ(store_.documents(), 0u);
}

TEST_F(OrchestratorTest, ExhaustedRetriesFailTarget) {
    primary_.push(error_response(ErrorType::Timeout, "timed out"));
    fallback_.push(error_response(ErrorType::Timeout, "timed out"));
    build(2, 5);

    auto outcome = run(onion('d'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
    EXPECT_EQ(outcome.reason, FailureReason::TransportExhausted);
    EXPECT_EQ(outcome.attempts.size(), 3u);
    EXPECT_EQ(outcome.retries, 2);
    EXPECT_FALSE(outcome.escalated);
    EXPECT_EQ(fallback_.calls(), 0u);
}

TEST_F(OrchestratorTest, PersistentServiceUnavailableIsAbandoned) {
    primary_.push(status_response(503));
    fallback_.push(status_response(503));
    build(3, 2);

    auto outcome = run(onion('k'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
    EXPECT_EQ(outcome.reason, FailureReason::TransportExhausted);
    EXPECT_EQ(outcome.detail, "http_status(503)");
    EXPECT_EQ(outcome.retries, 3);
    ASSERT_EQ(outcome.attempts.size(), 4u);
    for (std::size_t i = 1; i < outcome.attempts.size(); ++i)
        EXPECT_GT(outcome.attempts[i].retry_ordinal, outcome.attempts[i - 1].retry_ordinal);
    EXPECT_EQ(outcome.attempts.back().retry_ordinal, 3);
    EXPECT_EQ(store_.documents(), 0u);
}

TEST_F(OrchestratorTest, BodyPastHardLimitEndsTargetWithoutRetry) {
    primary_.push(error_response(ErrorType::TooLarge, "body limit exceeded"));
    build();

    auto outcome = run(onion('l'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
    EXPECT_EQ(outcome.reason, FailureReason::OversizedBody);
    EXPECT_EQ(outcome.retries, 0);
    EXPECT_EQ(outcome.rotations, 0);
    EXPECT_EQ(outcome.attempts.size(), 1u);
    EXPECT_EQ(primary_.calls(), 1u);
    EXPECT_EQ(fallback_.calls(), 0u);
    EXPECT_EQ(control_.newnym_calls, 0);
    EXPECT_EQ(anomalies_.count("oversized_body"), 1u);
}

TEST_F(OrchestratorTest, InvalidTargetIsSkippedWithoutNetwork) {
    build();
    auto outcome = run("https://example.com/");

    EXPECT_EQ(outcome.kind, OutcomeKind::SkippedInvalid);
    EXPECT_FALSE(outcome.detail.empty());
    EXPECT_EQ(primary_.calls(), 0u);
}

TEST_F(OrchestratorTest, AlreadyIngestedIsSkipped) {
    build();
    store_.seed(Target::Target::from_raw(onion('e')).content_address);

    auto outcome = run(onion('e'));
    EXPECT_EQ(outcome.kind, OutcomeKind::SkippedAlreadyIngested);
    EXPECT_EQ(primary_.calls(), 0u);
}

TEST_F(OrchestratorTest, EmptyBodyIsRetriedAndReported) {
    primary_.push(ok_response("short"));
    primary_.push(ok_response());
    build();

    auto outcome = run(onion('f'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Ingested);
    EXPECT_EQ(outcome.retries, 1);
    EXPECT_EQ(anomalies_.count("empty_body"), 1u);
    EXPECT_EQ(control_.newnym_calls, 0);
}

TEST_F(OrchestratorTest, FailedRotationIsReportedAndRetryContinues) {
    control_.newnym_result = false;
    primary_.push(error_response(ErrorType::ConnectionRefused));
    primary_.push(ok_response());
    build();

    auto outcome = run(onion('g'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Ingested);
    EXPECT_EQ(outcome.rotations, 0);
    EXPECT_EQ(anomalies_.count("rotation_failure"), 1u);
}

TEST_F(OrchestratorTest, StorageFailureFailsTarget) {
    store_.failures_left = 5;
    build();

    auto outcome = run(onion('h'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
    EXPECT_EQ(outcome.reason, FailureReason::StorageFailed);
    EXPECT_EQ(anomalies_.count("storage_failure"), 1u);
}

TEST_F(OrchestratorTest, CancelledRunFailsBeforeFetch) {
    build();
    cancel_.cancel();

    auto outcome = run(onion('i'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
    EXPECT_EQ(outcome.reason, FailureReason::RunCancelled);
    EXPECT_EQ(primary_.calls(), 0u);
}

TEST_F(OrchestratorTest, RequestBudgetTriggersRotationBeforeAttempt) {
    build();
    for (int i = 0; i < 10; ++i)
        circuits_->record_request();

    auto outcome = run(onion('j'));
    EXPECT_EQ(outcome.kind, OutcomeKind::Ingested);
    EXPECT_EQ(outcome.rotations, 1);
    EXPECT_EQ(circuits_->snapshot().request_count, 1);
}
