#include <gtest/gtest.h>
#include <thread>
#include "../../src/engine/run/ingestion_run.hpp"
#include "fakes.hpp"

using namespace Umbra;
using namespace Umbra::Engine;
using namespace UmbraTest;

namespace {

class IngestionRunTest : public ::testing::Test {
protected:
    FakeCircuitControl   control_;
    ScriptedHttpClient   primary_;
    ScriptedHttpClient   fallback_;
    MemoryDocumentStore  store_;
    RecordingAnomalySink anomalies_;
    ManualClock          clock_;

    Core::Config config() {
        Core::Config config;
        config.handle_signals          = false;
        config.max_timing_jitter_ms    = 0;
        config.backoff_base_seconds    = 0;
        config.random_rotation_enabled = false;
        config.max_concurrent_targets  = 2;
        config.content_threads         = 1;
        return config;
    }

    Collaborators collaborators(Network::Http::HttpClient* primary = nullptr) {
        Collaborators c;
        c.primary   = primary ? primary : &primary_;
        c.fallback  = &fallback_;
        c.control   = &control_;
        c.store     = &store_;
        c.anomalies = &anomalies_;
        c.clock     = clock_.fn();
        return c;
    }
};

}  // namespace

TEST_F(IngestionRunTest, MixedTargetList) {
    IngestionRun run(config(), collaborators());
    auto         report = run.execute({onion('a'), onion('b'), onion('a'), "http://notonion.com/", ""});

    EXPECT_FALSE(report.fatal);
    EXPECT_EQ(report.summary.targets_total(), 5u);
    EXPECT_EQ(report.summary.ingested(), 2u);
    EXPECT_EQ(report.summary.skipped_duplicate(), 1u);
    EXPECT_EQ(report.summary.skipped_invalid(), 2u);
    EXPECT_EQ(report.summary.failed(), 0u);
    EXPECT_EQ(report.summary.not_started(), 0u);
    EXPECT_EQ(report.outcomes.size(), 5u);
    EXPECT_EQ(primary_.calls(), 2u);
    EXPECT_EQ(store_.documents(), 2u);
    EXPECT_EQ(control_.probe_calls, 1);
}

TEST_F(IngestionRunTest, PreviouslyStoredTargetIsSkipped) {
    store_.seed(Target::Target::from_raw(onion('c')).content_address);
    IngestionRun run(config(), collaborators());

    auto report = run.execute({onion('c')});
    EXPECT_EQ(report.summary.skipped_duplicate(), 1u);
    EXPECT_EQ(primary_.calls(), 0u);
}

TEST_F(IngestionRunTest, UnreachableControlChannelIsFatal) {
    control_.probe_result = false;
    IngestionRun run(config(), collaborators());

    auto report = run.execute({onion('d'), onion('e')});
    EXPECT_TRUE(report.fatal);
    EXPECT_FALSE(report.fatal_error.empty());
    EXPECT_EQ(report.summary.not_started(), 2u);
    EXPECT_EQ(primary_.calls(), 0u);
}

TEST_F(IngestionRunTest, ProbeSkippedWhenNotRequired) {
    control_.probe_result         = false;
    auto cfg                      = config();
    cfg.require_control_channel   = false;
    IngestionRun run(cfg, collaborators());

    auto report = run.execute({onion('f')});
    EXPECT_FALSE(report.fatal);
    EXPECT_EQ(report.summary.ingested(), 1u);
    EXPECT_EQ(control_.probe_calls, 0);
}

TEST_F(IngestionRunTest, DeadlineCancelsHangingRequests) {
    HangingHttpClient hanging;
    auto              cfg    = config();
    cfg.run_deadline_seconds = 0.2;
    IngestionRun run(cfg, collaborators(&hanging));

    auto report = run.execute({onion('g'), onion('h'), onion('i')});
    EXPECT_FALSE(report.fatal);
    EXPECT_TRUE(report.summary.cancelled());
    EXPECT_EQ(report.summary.failed(), 3u);
    EXPECT_EQ(report.summary.ingested(), 0u);
    EXPECT_EQ(hanging.calls, 2);
    for (const auto& outcome : report.outcomes)
        EXPECT_EQ(outcome.reason, FailureReason::RunCancelled);
}

TEST_F(IngestionRunTest, DeadlineDuringBackoffKeepsIngestedTargets) {
    RoutedHttpClient routed;
    routed.route(std::string(56, 'm') + ".onion", status_response(503));
    routed.route(std::string(56, 'n') + ".onion", status_response(503));

    auto cfg                   = config();
    cfg.max_concurrent_targets = 3;
    cfg.backoff_base_seconds   = 60;
    cfg.run_deadline_seconds   = 0.5;
    IngestionRun run(cfg, collaborators(&routed));

    auto report = run.execute({onion('l'), onion('m'), onion('n')});
    EXPECT_FALSE(report.fatal);
    EXPECT_TRUE(report.summary.cancelled());
    EXPECT_EQ(report.summary.ingested(), 1u);
    EXPECT_EQ(report.summary.failed(), 2u);
    EXPECT_EQ(report.summary.retries(), 2u);
    EXPECT_EQ(store_.documents(), 1u);

    const std::string ingested = Target::Target::from_raw(onion('l')).content_address;
    ASSERT_EQ(report.outcomes.size(), 3u);
    for (const auto& outcome : report.outcomes) {
        if (outcome.content_address == ingested) {
            EXPECT_EQ(outcome.kind, OutcomeKind::Ingested);
            continue;
        }
        // Each 503 target was waiting out its first backoff.
        EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
        EXPECT_EQ(outcome.reason, FailureReason::RunCancelled);
        EXPECT_EQ(outcome.retries, 1);
        EXPECT_EQ(outcome.attempts.size(), 1u);
    }
    EXPECT_EQ(routed.calls(onion('m')), 1);
    EXPECT_EQ(routed.calls(onion('n')), 1);
}

TEST_F(IngestionRunTest, ExternalCancelStopsRun) {
    HangingHttpClient hanging;
    IngestionRun      run(config(), collaborators(&hanging));

    std::thread canceller([&run] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        run.cancel();
    });
    auto report = run.execute({onion('j')});
    canceller.join();

    EXPECT_TRUE(report.summary.cancelled());
    EXPECT_EQ(report.summary.failed(), 1u);
}

TEST_F(IngestionRunTest, ExecuteIsSingleUse) {
    IngestionRun run(config(), collaborators());
    run.execute({onion('k')});
    EXPECT_THROW(run.execute({onion('k')}), std::logic_error);
}
