#pragma once
#include <chrono>
#include <cmath>
#include <cstddef>

namespace Umbra {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "0.1.0";

    // Circuit rotation
    static constexpr int    DEFAULT_MAX_REQUESTS_PER_CIRCUIT  = 10;
    static constexpr int    DEFAULT_MIN_CIRCUIT_LIFESPAN_SECS = 30;
    static constexpr double DEFAULT_RANDOM_ROTATION_CHANCE    = 0.2;
    static constexpr int    DEFAULT_CIRCUIT_HOPS              = 3;

    // Retry / escalation
    static constexpr int    DEFAULT_MAX_RETRIES                = 3;
    static constexpr double DEFAULT_BACKOFF_FACTOR             = 1.5;
    static constexpr double DEFAULT_BACKOFF_BASE_SECONDS       = 1.0;
    static constexpr int    DEFAULT_ESCALATION_RETRY_THRESHOLD = 2;

    // Transport
    static constexpr int         DEFAULT_REQUEST_TIMEOUT_SECONDS  = 60;
    static constexpr int         DEFAULT_FALLBACK_TIMEOUT_SECONDS = 120;
    static constexpr int         DEFAULT_CONNECT_TIMEOUT_MS       = 30000;
    static constexpr int         DEFAULT_CONTROL_TIMEOUT_MS       = 10000;
    static constexpr std::size_t DEFAULT_MIN_CONTENT_LENGTH       = 50;
    static constexpr std::size_t DEFAULT_MAX_BODY_SIZE_BYTES      = 5000000;
    static constexpr std::size_t BODY_HARD_LIMIT_MULTIPLIER       = 4;
    static constexpr int         DEFAULT_MAX_TIMING_JITTER_MS     = 2000;
    static constexpr int         DEFAULT_SLOW_ATTEMPT_SECONDS     = 45;

    static constexpr const char* DEFAULT_TOR_SOCKS_PROXY  = "socks5://127.0.0.1:9050";
    static constexpr const char* DEFAULT_TOR_CONTROL_HOST = "127.0.0.1";
    static constexpr int         DEFAULT_TOR_CONTROL_PORT = 9051;
    static constexpr const char* DEFAULT_I2P_HTTP_PROXY   = "http://127.0.0.1:4444";
    static constexpr const char* CONTROL_PASSWORD_ENV     = "UMBRA_TOR_CONTROL_PASSWORD";

    // Scheduling
    static constexpr int DEFAULT_MAX_CONCURRENT_TARGETS = 8;
    static constexpr int DEFAULT_CONTENT_THREADS        = 2;
    static constexpr int DEFAULT_MAX_REPORTED_FAILURES  = 10;

    // Content pipeline
    static constexpr int         DEFAULT_CHUNK_SIZE    = 1000;
    static constexpr int         DEFAULT_CHUNK_OVERLAP = 200;
    static constexpr int         CHARS_PER_WORD        = 5;
    static constexpr const char* DEFAULT_OUTPUT_DIR    = "umbra_store";

    static constexpr const char* ONION_SUFFIX = ".onion";
};

// Delay before retry `ordinal` (1-based): base * factor^(ordinal-1) seconds.
inline std::chrono::milliseconds get_backoff_time(double base_seconds, double factor, int ordinal) {
    if (ordinal <= 0)
        return std::chrono::milliseconds(0);
    double seconds = base_seconds * std::pow(factor, ordinal - 1);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

}  // namespace Core
}  // namespace Umbra
