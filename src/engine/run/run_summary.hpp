#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "../orchestrator/fetch_orchestrator.hpp"

namespace Umbra {
namespace Engine {

struct FailureEntry {
    std::string target_hash;
    std::string reason;
    std::string detail;
};

// Targets appear only as content-addresses.
class RunSummary {
public:
    explicit RunSummary(std::size_t max_reported_failures = 10);

    void record(const TargetOutcome& outcome);
    void set_targets_total(std::size_t total) {
        targets_total_ = total;
    }
    void set_rotations(std::size_t rotations) {
        rotations_ = rotations;
    }
    void mark_cancelled() {
        cancelled_ = true;
    }

    std::size_t targets_total() const {
        return targets_total_;
    }
    std::size_t ingested() const {
        return ingested_;
    }
    std::size_t skipped_duplicate() const {
        return skipped_duplicate_;
    }
    std::size_t skipped_invalid() const {
        return skipped_invalid_;
    }
    std::size_t failed() const {
        return failed_;
    }
    std::size_t chunks_ingested() const {
        return chunks_ingested_;
    }
    std::size_t retries() const {
        return retries_;
    }
    std::size_t rotations() const {
        return rotations_;
    }
    std::size_t escalations() const {
        return escalations_;
    }
    std::size_t failures_omitted() const {
        return failures_omitted_;
    }
    bool cancelled() const {
        return cancelled_;
    }
    const std::vector<FailureEntry>& failures() const {
        return failures_;
    }

    // Targets that never reached a terminal outcome (fatal early exit).
    std::size_t not_started() const;

    nlohmann::json to_json() const;
    void           log() const;

    // Throws std::runtime_error when the file cannot be written.
    void write(const std::string& path) const;

private:
    std::size_t               max_reported_failures_;
    std::size_t               targets_total_     = 0;
    std::size_t               ingested_          = 0;
    std::size_t               skipped_duplicate_ = 0;
    std::size_t               skipped_invalid_   = 0;
    std::size_t               failed_            = 0;
    std::size_t               chunks_ingested_   = 0;
    std::size_t               retries_           = 0;
    std::size_t               rotations_         = 0;
    std::size_t               escalations_       = 0;
    std::size_t               failures_omitted_  = 0;
    bool                      cancelled_         = false;
    std::vector<FailureEntry> failures_;
};

}  // namespace Engine
}  // namespace Umbra
