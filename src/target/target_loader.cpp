#include "target_loader.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Umbra {
namespace Target {

using namespace Umbra::Core;
using namespace Umbra::Utils;

std::vector<std::string> TargetLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open target list: " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::vector<std::string> TargetLoader::parse(const std::string& content) {
    std::string trimmed = Text::trim(content);
    if (trimmed.empty())
        return {};

    if (trimmed.front() == '[' && trimmed.back() == ']') {
        try {
            auto                     json = nlohmann::json::parse(trimmed);
            std::vector<std::string> targets;
            for (const auto& entry : json) {
                if (!entry.is_string()) {
                    Logger::warn("Ignoring non-string entry in target list");
                    continue;
                }
                std::string value = Text::trim(entry.get<std::string>());
                if (!value.empty())
                    targets.push_back(std::move(value));
            }
            return targets;
        } catch (const nlohmann::json::exception& e) {
            Logger::debug("Target list is not JSON, reading lines: " + std::string(e.what()));
        }
    }

    return Text::split_lines(trimmed);
}

}  // namespace Target
}  // namespace Umbra
