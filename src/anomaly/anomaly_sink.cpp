#include "anomaly_sink.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include "../core/logger/logger.hpp"

namespace Umbra {
namespace Anomaly {

using namespace Umbra::Core;

std::string format_details(const AnomalyDetails& details) {
    std::string out;
    for (const auto& [key, value] : details) {
        if (!out.empty())
            out += ", ";
        out += key + "=" + value;
    }
    return out;
}

void LogAnomalySink::report(const std::string& description, const AnomalyDetails& details) {
    Logger::warn("Anomaly: " + description
                 + (details.empty() ? "" : " {" + format_details(details) + "}"));
}

JsonlAnomalySink::JsonlAnomalySink(const std::string& path)
    : path_(path), file_(path, std::ios::out | std::ios::app) {
    if (!file_.is_open()) {
        Logger::warn("Anomaly log unavailable: " + path_);
    }
}

void JsonlAnomalySink::report(const std::string& description, const AnomalyDetails& details) {
    nlohmann::json record = {
        {"timestamp",
         std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
             .count()},
        {"description", description},
        {"details", details}};

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        Logger::warn("Anomaly dropped: " + description);
        return;
    }
    file_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    file_.flush();
    if (!file_) {
        Logger::warn("Anomaly log write failed: " + path_);
        file_.clear();
    }
}

}  // namespace Anomaly
}  // namespace Umbra
