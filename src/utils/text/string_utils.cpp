#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Umbra {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream       in(str);
    std::string              word;
    while (in >> word)
        words.push_back(std::move(word));
    return words;
}

std::vector<std::string> split_lines(const std::string& str) {
    std::vector<std::string> lines;
    std::istringstream       in(str);
    std::string              line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty())
            lines.push_back(std::move(line));
    }
    return lines;
}

std::string join(const std::vector<std::string>& parts,
                 size_t                          begin,
                 size_t                          end,
                 const std::string&              separator) {
    std::string out;
    end = std::min(end, parts.size());
    for (size_t i = begin; i < end; ++i) {
        if (i > begin)
            out += separator;
        out += parts[i];
    }
    return out;
}

std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool pending_space = false;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Umbra
