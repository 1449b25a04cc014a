#pragma once
#include <mutex>
#include <string>

namespace Umbra {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_INFO    = 1 << 0,
    LOG_WARN    = 1 << 1,
    LOG_ERROR   = 1 << 2,
    LOG_SUCCESS = 1 << 3,
    LOG_DEBUG   = 1 << 4,
    LOG_DEFAULT = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS,
    LOG_ALL     = LOG_DEFAULT | LOG_DEBUG
};

class Logger {
public:
    static void set_level(int level);
    static int  level();

    // Maps "none|error|warn|info|debug|all" to a level mask. Throws on unknown names.
    static int parse_level(const std::string& name);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // Replaces onion hostnames, IPv4 and MAC addresses with [REDACTED].
    static std::string redact(const std::string& message);

private:
    static void write(int level, const char* color, const char* tag, const std::string& message);

    static int        level_;
    static std::mutex mutex_;
};

}  // namespace Core
}  // namespace Umbra
