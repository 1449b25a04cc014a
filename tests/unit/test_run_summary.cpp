#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/engine/run/run_summary.hpp"

using namespace Umbra;
using namespace Umbra::Engine;

namespace {
TargetOutcome outcome(OutcomeKind kind, FailureReason reason = FailureReason::None) {
    TargetOutcome out;
    out.kind            = kind;
    out.reason          = reason;
    out.content_address = std::string(64, 'f');
    return out;
}
}  // namespace

TEST(RunSummaryTest, CountsEveryOutcomeKind) {
    RunSummary summary;
    summary.set_targets_total(5);

    auto ingested      = outcome(OutcomeKind::Ingested);
    ingested.chunks    = 7;
    ingested.retries   = 2;
    ingested.escalated = true;
    summary.record(ingested);
    summary.record(outcome(OutcomeKind::SkippedAlreadyIngested));
    summary.record(outcome(OutcomeKind::SkippedInvalid));
    summary.record(outcome(OutcomeKind::Failed, FailureReason::TransportExhausted));

    EXPECT_EQ(summary.ingested(), 1u);
    EXPECT_EQ(summary.skipped_duplicate(), 1u);
    EXPECT_EQ(summary.skipped_invalid(), 1u);
    EXPECT_EQ(summary.failed(), 1u);
    EXPECT_EQ(summary.chunks_ingested(), 7u);
    EXPECT_EQ(summary.retries(), 2u);
    EXPECT_EQ(summary.escalations(), 1u);
    EXPECT_EQ(summary.not_started(), 1u);
    EXPECT_FALSE(summary.cancelled());
}

TEST(RunSummaryTest, FailureListIsBounded) {
    RunSummary summary(2);
    for (int i = 0; i < 5; ++i)
        summary.record(outcome(OutcomeKind::Failed, FailureReason::NonRetryableStatus));

    EXPECT_EQ(summary.failures().size(), 2u);
    EXPECT_EQ(summary.failures_omitted(), 3u);
    EXPECT_EQ(summary.failures()[0].reason, "non_retryable_status");
}

TEST(RunSummaryTest, CancelledOutcomeMarksRun) {
    RunSummary summary;
    summary.record(outcome(OutcomeKind::Failed, FailureReason::RunCancelled));
    EXPECT_TRUE(summary.cancelled());
}

TEST(RunSummaryTest, DetailsAreRedacted) {
    RunSummary summary;
    auto       failed = outcome(OutcomeKind::Failed, FailureReason::TransportExhausted);
    failed.detail     = "connect to " + std::string(56, 'a') + ".onion failed";
    summary.record(failed);

    EXPECT_EQ(summary.failures()[0].detail.find(".onion"), std::string::npos);
}

TEST(RunSummaryTest, JsonAndFileOutput) {
    RunSummary summary;
    summary.set_targets_total(1);
    summary.set_rotations(3);
    summary.record(outcome(OutcomeKind::Ingested));

    auto json = summary.to_json();
    EXPECT_EQ(json["targets_total"], 1);
    EXPECT_EQ(json["ingested"], 1);
    EXPECT_EQ(json["rotations"], 3);
    EXPECT_EQ(json["not_started"], 0);
    EXPECT_TRUE(json["failures"].is_array());

    summary.write("test_summary.json");
    std::ifstream  in("test_summary.json");
    nlohmann::json loaded = nlohmann::json::parse(in);
    EXPECT_EQ(loaded, json);
    std::remove("test_summary.json");

    EXPECT_THROW(summary.write("/nonexistent_dir_umbra/summary.json"), std::runtime_error);
}
