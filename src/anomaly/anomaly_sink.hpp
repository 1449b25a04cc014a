#pragma once
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace Umbra {
namespace Anomaly {

using AnomalyDetails = std::map<std::string, std::string>;

// Best-effort: implementations log their own failures and never throw.
class AnomalySink {
public:
    virtual ~AnomalySink() = default;

    virtual void report(const std::string& description, const AnomalyDetails& details) = 0;
};

class LogAnomalySink : public AnomalySink {
public:
    void report(const std::string& description, const AnomalyDetails& details) override;
};

// Appends one JSON object per report to a file.
class JsonlAnomalySink : public AnomalySink {
public:
    explicit JsonlAnomalySink(const std::string& path);

    void report(const std::string& description, const AnomalyDetails& details) override;

private:
    std::string   path_;
    std::mutex    mutex_;
    std::ofstream file_;
};

std::string format_details(const AnomalyDetails& details);

}  // namespace Anomaly
}  // namespace Umbra
