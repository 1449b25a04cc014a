#pragma once

#include <string>
#include <vector>

namespace Umbra {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
bool                     starts_with(const std::string& str, const std::string& prefix);
bool                     ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split_whitespace(const std::string& str);
std::vector<std::string> split_lines(const std::string& str);
std::string              join(const std::vector<std::string>& parts,
                              size_t                          begin,
                              size_t                          end,
                              const std::string&              separator);

// Collapses runs of whitespace to a single space and trims both ends.
std::string collapse_whitespace(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace Umbra
