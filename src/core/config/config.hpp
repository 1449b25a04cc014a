#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Umbra {
namespace Core {

struct Config {
    // Circuit rotation
    int    max_requests_per_circuit     = Constants::DEFAULT_MAX_REQUESTS_PER_CIRCUIT;
    int    min_circuit_lifespan_seconds = Constants::DEFAULT_MIN_CIRCUIT_LIFESPAN_SECS;
    double random_rotation_probability  = Constants::DEFAULT_RANDOM_ROTATION_CHANCE;
    bool   random_rotation_enabled      = true;
    int    circuit_hops                 = Constants::DEFAULT_CIRCUIT_HOPS;

    // Retry / escalation
    int    max_retries                = Constants::DEFAULT_MAX_RETRIES;
    double backoff_factor             = Constants::DEFAULT_BACKOFF_FACTOR;
    double backoff_base_seconds       = Constants::DEFAULT_BACKOFF_BASE_SECONDS;
    int    escalation_retry_threshold = Constants::DEFAULT_ESCALATION_RETRY_THRESHOLD;
    bool   fallback_transport_enabled = true;

    // Transport
    int         request_timeout_seconds  = Constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;
    int         fallback_timeout_seconds = Constants::DEFAULT_FALLBACK_TIMEOUT_SECONDS;
    int         connect_timeout_ms       = Constants::DEFAULT_CONNECT_TIMEOUT_MS;
    int         control_timeout_ms       = Constants::DEFAULT_CONTROL_TIMEOUT_MS;
    long long   min_content_length       = Constants::DEFAULT_MIN_CONTENT_LENGTH;
    long long   max_body_size_bytes      = Constants::DEFAULT_MAX_BODY_SIZE_BYTES;
    int         max_timing_jitter_ms     = Constants::DEFAULT_MAX_TIMING_JITTER_MS;
    int         slow_attempt_seconds     = Constants::DEFAULT_SLOW_ATTEMPT_SECONDS;
    std::string tor_socks_proxy          = Constants::DEFAULT_TOR_SOCKS_PROXY;
    std::string tor_control_host         = Constants::DEFAULT_TOR_CONTROL_HOST;
    int         tor_control_port         = Constants::DEFAULT_TOR_CONTROL_PORT;
    std::string tor_control_password;
    std::string i2p_http_proxy = Constants::DEFAULT_I2P_HTTP_PROXY;

    // Scheduling
    int    max_concurrent_targets  = Constants::DEFAULT_MAX_CONCURRENT_TARGETS;
    int    content_threads         = Constants::DEFAULT_CONTENT_THREADS;
    double run_deadline_seconds    = 0;  // 0 = none
    bool   require_control_channel = true;
    bool   handle_signals          = true;
    int    max_reported_failures   = Constants::DEFAULT_MAX_REPORTED_FAILURES;

    // Content pipeline
    int         chunk_size    = Constants::DEFAULT_CHUNK_SIZE;
    int         chunk_overlap = Constants::DEFAULT_CHUNK_OVERLAP;
    std::string output_dir    = Constants::DEFAULT_OUTPUT_DIR;

    // Output
    std::string summary_path;
    std::string anomaly_log;
    std::string log_level = "info";

    // Inputs
    std::vector<std::string> target_files;
    std::vector<std::string> urls;
    std::string              config_path;

    static Config parse(int argc, char* argv[]);

    // Throws std::runtime_error naming the first out-of-range option.
    void validate() const;

    // Fills unset secrets from the environment.
    void apply_environment();
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Umbra
