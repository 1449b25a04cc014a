#pragma once
#include <string>
#include <vector>

namespace Umbra {
namespace Target {

class TargetLoader {
public:
    // Reads a JSON array of address strings or a newline-delimited list.
    // Throws std::runtime_error when the file cannot be read.
    static std::vector<std::string> load_file(const std::string& path);

    static std::vector<std::string> parse(const std::string& content);
};

}  // namespace Target
}  // namespace Umbra
