#include "logger.hpp"
#include <iostream>
#include <regex>
#include <stdexcept>

namespace Umbra {
namespace Core {

int Logger::level_ = LogLevel::LOG_DEFAULT;

std::mutex Logger::mutex_;

namespace {
const std::string RESET  = "\033[0m";
const std::string RED    = "\033[31m";
const std::string GREEN  = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string BLUE   = "\033[34m";
const std::string GRAY   = "\033[90m";

const std::regex& redaction_pattern() {
    static const std::regex pattern(
        R"(([a-z2-7]{16,56}\.onion)|((?:\d{1,3}\.){3}\d{1,3})|([0-9a-fA-F]{2}(?::[0-9a-fA-F]{2}){5}))",
        std::regex::optimize);
    return pattern;
}
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

int Logger::parse_level(const std::string& name) {
    if (name == "none")
        return LOG_NONE;
    if (name == "error")
        return LOG_ERROR;
    if (name == "warn")
        return LOG_WARN | LOG_ERROR;
    if (name == "info")
        return LOG_DEFAULT;
    if (name == "debug" || name == "all")
        return LOG_ALL;
    throw std::runtime_error("Unknown log level: " + name);
}

std::string Logger::redact(const std::string& message) {
    return std::regex_replace(message, redaction_pattern(), "[REDACTED]");
}

void Logger::write(int level, const char* color, const char* tag, const std::string& message) {
    std::string clean = redact(message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;
    std::ostream& out = (level == LOG_WARN || level == LOG_ERROR) ? std::cerr : std::cout;
    out << color << tag << RESET << clean << std::endl;
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, GRAY.c_str(), "[DEBUG] ", message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, BLUE.c_str(), "[INFO] ", message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, GREEN.c_str(), "[SUCCESS] ", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, YELLOW.c_str(), "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, RED.c_str(), "[ERROR] ", message);
}

}  // namespace Core
}  // namespace Umbra
