#include "run_summary.hpp"
#include <fstream>
#include <stdexcept>
#include "../../core/logger/logger.hpp"

namespace Umbra {
namespace Engine {

using namespace Umbra::Core;

RunSummary::RunSummary(std::size_t max_reported_failures)
    : max_reported_failures_(max_reported_failures) {
}

void RunSummary::record(const TargetOutcome& outcome) {
    retries_ += static_cast<std::size_t>(outcome.retries);
    if (outcome.escalated)
        ++escalations_;

    switch (outcome.kind) {
        case OutcomeKind::Ingested:
            ++ingested_;
            chunks_ingested_ += outcome.chunks;
            return;
        case OutcomeKind::SkippedAlreadyIngested: ++skipped_duplicate_; return;
        case OutcomeKind::SkippedInvalid: ++skipped_invalid_; return;
        case OutcomeKind::Failed: break;
    }

    ++failed_;
    if (outcome.reason == FailureReason::RunCancelled)
        cancelled_ = true;
    if (failures_.size() >= max_reported_failures_) {
        ++failures_omitted_;
        return;
    }
    failures_.push_back(FailureEntry{.target_hash = outcome.content_address,
                                     .reason      = to_string(outcome.reason),
                                     .detail      = Logger::redact(outcome.detail)});
}

std::size_t RunSummary::not_started() const {
    std::size_t done = ingested_ + skipped_duplicate_ + skipped_invalid_ + failed_;
    return done >= targets_total_ ? 0 : targets_total_ - done;
}

nlohmann::json RunSummary::to_json() const {
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& entry : failures_) {
        failures.push_back(
            {{"target_hash", entry.target_hash}, {"reason", entry.reason}, {"detail", entry.detail}});
    }
    return {{"targets_total", targets_total_},
            {"ingested", ingested_},
            {"skipped_duplicate", skipped_duplicate_},
            {"skipped_invalid", skipped_invalid_},
            {"failed", failed_},
            {"not_started", not_started()},
            {"chunks_ingested", chunks_ingested_},
            {"retries", retries_},
            {"rotations", rotations_},
            {"escalations", escalations_},
            {"cancelled", cancelled_},
            {"failures", failures},
            {"failures_omitted", failures_omitted_}};
}

void RunSummary::log() const {
    Logger::info("Ingestion complete: " + std::to_string(targets_total_) + " targets, "
                 + std::to_string(ingested_) + " ingested, " + std::to_string(skipped_duplicate_)
                 + " duplicate, " + std::to_string(skipped_invalid_) + " invalid, "
                 + std::to_string(failed_) + " failed");
    Logger::info("Chunks ingested: " + std::to_string(chunks_ingested_) + ", retries: "
                 + std::to_string(retries_) + ", rotations: " + std::to_string(rotations_)
                 + ", escalations: " + std::to_string(escalations_));
    for (const auto& entry : failures_) {
        Logger::warn("Failed " + entry.target_hash.substr(0, 12) + ": " + entry.reason
                     + (entry.detail.empty() ? "" : " (" + entry.detail + ")"));
    }
    if (failures_omitted_ > 0)
        Logger::warn(std::to_string(failures_omitted_) + " further failures not listed");
}

void RunSummary::write(const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open())
        throw std::runtime_error("Cannot write summary: " + path);
    file << to_json().dump(2) << '\n';
    if (!file)
        throw std::runtime_error("Failed writing summary: " + path);
}

}  // namespace Engine
}  // namespace Umbra
