#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../logger/logger.hpp"

namespace Umbra {
namespace Core {

namespace {

constexpr int EXIT_USAGE = 1;

template <typename T>
void read_key(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

void require(bool condition, const std::string& message) {
    if (!condition)
        throw std::runtime_error("Invalid configuration: " + message);
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        read_key(yaml, "max_requests_per_circuit", config.max_requests_per_circuit);
        read_key(yaml, "min_circuit_lifespan_seconds", config.min_circuit_lifespan_seconds);
        read_key(yaml, "random_rotation_probability", config.random_rotation_probability);
        read_key(yaml, "random_rotation_enabled", config.random_rotation_enabled);
        read_key(yaml, "circuit_hops", config.circuit_hops);

        read_key(yaml, "max_retries", config.max_retries);
        read_key(yaml, "backoff_factor", config.backoff_factor);
        read_key(yaml, "backoff_base_seconds", config.backoff_base_seconds);
        read_key(yaml, "escalation_retry_threshold", config.escalation_retry_threshold);
        read_key(yaml, "fallback_transport_enabled", config.fallback_transport_enabled);

        read_key(yaml, "request_timeout_seconds", config.request_timeout_seconds);
        read_key(yaml, "fallback_timeout_seconds", config.fallback_timeout_seconds);
        read_key(yaml, "connect_timeout_ms", config.connect_timeout_ms);
        read_key(yaml, "control_timeout_ms", config.control_timeout_ms);
        read_key(yaml, "min_content_length", config.min_content_length);
        read_key(yaml, "max_body_size_bytes", config.max_body_size_bytes);
        read_key(yaml, "max_timing_jitter_ms", config.max_timing_jitter_ms);
        read_key(yaml, "slow_attempt_seconds", config.slow_attempt_seconds);
        read_key(yaml, "tor_socks_proxy", config.tor_socks_proxy);
        read_key(yaml, "tor_control_host", config.tor_control_host);
        read_key(yaml, "tor_control_port", config.tor_control_port);
        read_key(yaml, "tor_control_password", config.tor_control_password);
        read_key(yaml, "i2p_http_proxy", config.i2p_http_proxy);

        read_key(yaml, "max_concurrent_targets", config.max_concurrent_targets);
        read_key(yaml, "content_threads", config.content_threads);
        read_key(yaml, "run_deadline_seconds", config.run_deadline_seconds);
        read_key(yaml, "require_control_channel", config.require_control_channel);
        read_key(yaml, "max_reported_failures", config.max_reported_failures);

        read_key(yaml, "chunk_size", config.chunk_size);
        read_key(yaml, "chunk_overlap", config.chunk_overlap);
        read_key(yaml, "output_dir", config.output_dir);

        read_key(yaml, "summary_path", config.summary_path);
        read_key(yaml, "anomaly_log", config.anomaly_log);
        read_key(yaml, "log_level", config.log_level);

        if (yaml["target_file"])
            config.target_files.push_back(yaml["target_file"].as<std::string>());
        if (yaml["targets"] && yaml["targets"].IsSequence()) {
            for (const auto& node : yaml["targets"])
                config.urls.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"umbra - anonymized onion-address ingestion"};

    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("-f,--file", config.target_files, "Target list (JSON array or one per line)");
    app.add_option("-u,--url", config.urls, "Target address (repeatable)");
    app.add_option("-o,--output", config.output_dir, "Document store directory");
    app.add_option("--summary", config.summary_path, "Write the run summary as JSON");
    app.add_option("--anomaly-log", config.anomaly_log, "Append anomalies as JSON lines");
    app.add_option("--log-level", config.log_level, "none|error|warn|info|debug|all");

    app.add_option("--max-requests-per-circuit", config.max_requests_per_circuit);
    app.add_option("--min-circuit-lifespan", config.min_circuit_lifespan_seconds, "Seconds");
    app.add_option("--rotation-probability", config.random_rotation_probability);
    app.add_option("--circuit-hops", config.circuit_hops);
    app.add_option("--max-retries", config.max_retries);
    app.add_option("--backoff-factor", config.backoff_factor);
    app.add_option("--backoff-base", config.backoff_base_seconds, "Seconds");
    app.add_option("--escalation-threshold", config.escalation_retry_threshold);
    app.add_option("--timeout", config.request_timeout_seconds, "Primary request timeout (s)");
    app.add_option("--fallback-timeout", config.fallback_timeout_seconds, "Seconds");
    app.add_option("--connect-timeout", config.connect_timeout_ms, "Milliseconds");
    app.add_option("--min-content-length", config.min_content_length, "Bytes");
    app.add_option("--max-body-size", config.max_body_size_bytes, "Bytes");
    app.add_option("--max-jitter", config.max_timing_jitter_ms, "Milliseconds");
    app.add_option("--slow-attempt", config.slow_attempt_seconds, "Seconds");
    app.add_option("--socks-proxy", config.tor_socks_proxy, "Primary overlay SOCKS5 endpoint");
    app.add_option("--control-host", config.tor_control_host);
    app.add_option("--control-port", config.tor_control_port);
    app.add_option("--i2p-proxy", config.i2p_http_proxy, "Fallback overlay HTTP proxy");
    app.add_option("-c,--concurrency", config.max_concurrent_targets, "Targets in flight");
    app.add_option("--content-threads", config.content_threads);
    app.add_option("--deadline", config.run_deadline_seconds, "Run deadline in seconds");
    app.add_option("--max-reported-failures", config.max_reported_failures);
    app.add_option("--chunk-size", config.chunk_size, "Characters");
    app.add_option("--chunk-overlap", config.chunk_overlap, "Characters");

    app.add_flag(
        "--no-fallback",
        [&](size_t count) {
            if (count > 0)
                config.fallback_transport_enabled = false;
        },
        "Never escalate to the fallback transport");
    app.add_flag(
        "--no-random-rotation",
        [&](size_t count) {
            if (count > 0)
                config.random_rotation_enabled = false;
        },
        "Rotate only on request count and failures");
    app.add_flag(
        "--skip-control-check",
        [&](size_t count) {
            if (count > 0)
                config.require_control_channel = false;
        },
        "Do not probe the control channel at startup");

    app.add_option("urls", config.urls, "Target addresses");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        exit(code == 0 ? 0 : EXIT_USAGE);
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            int code = app.exit(e);
            exit(code == 0 ? 0 : EXIT_USAGE);
        }
    }

    config.apply_environment();
    return config;
}

void Config::apply_environment() {
    if (tor_control_password.empty()) {
        if (const char* secret = std::getenv(Constants::CONTROL_PASSWORD_ENV))
            tor_control_password = secret;
    }
}

void Config::validate() const {
    require(max_requests_per_circuit >= 1, "max_requests_per_circuit must be >= 1");
    require(min_circuit_lifespan_seconds >= 0, "min_circuit_lifespan_seconds must be >= 0");
    require(random_rotation_probability >= 0.0 && random_rotation_probability <= 1.0,
            "random_rotation_probability must be within [0, 1]");
    require(circuit_hops >= 1, "circuit_hops must be >= 1");

    require(max_retries >= 0, "max_retries must be >= 0");
    require(backoff_factor >= 1.0, "backoff_factor must be >= 1");
    require(backoff_base_seconds >= 0.0, "backoff_base_seconds must be >= 0");
    require(escalation_retry_threshold >= 0, "escalation_retry_threshold must be >= 0");

    require(request_timeout_seconds > 0, "request_timeout_seconds must be > 0");
    require(fallback_timeout_seconds > 0, "fallback_timeout_seconds must be > 0");
    require(connect_timeout_ms > 0, "connect_timeout_ms must be > 0");
    require(control_timeout_ms > 0, "control_timeout_ms must be > 0");
    require(min_content_length >= 0, "min_content_length must be >= 0");
    require(max_body_size_bytes > 0, "max_body_size_bytes must be > 0");
    require(min_content_length <= max_body_size_bytes,
            "min_content_length must not exceed max_body_size_bytes");
    require(max_timing_jitter_ms >= 0, "max_timing_jitter_ms must be >= 0");
    require(slow_attempt_seconds >= 0, "slow_attempt_seconds must be >= 0");
    require(tor_socks_proxy.rfind("socks5", 0) == 0, "tor_socks_proxy must be a socks5:// URL");
    require(tor_control_port > 0 && tor_control_port <= 65535, "tor_control_port out of range");
    require(!fallback_transport_enabled || !i2p_http_proxy.empty(),
            "i2p_http_proxy is required when the fallback transport is enabled");

    require(max_concurrent_targets >= 1, "max_concurrent_targets must be >= 1");
    require(content_threads >= 1, "content_threads must be >= 1");
    require(run_deadline_seconds >= 0.0, "run_deadline_seconds must be >= 0");
    require(max_reported_failures >= 0, "max_reported_failures must be >= 0");

    require(chunk_size > 0 && chunk_overlap >= 0, "chunk sizes must be positive");
    require(chunk_size / Constants::CHARS_PER_WORD > chunk_overlap / Constants::CHARS_PER_WORD,
            "chunk_size must exceed chunk_overlap");

    Logger::parse_level(log_level);
}

}  // namespace Core
}  // namespace Umbra
