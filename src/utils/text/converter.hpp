#pragma once
#include <string>

namespace Umbra {
namespace Utils {
namespace Text {

class Converter {
public:
    struct Extracted {
        std::string title;
        std::string text;
    };

    // Visible text of an HTML document: text nodes joined by single spaces,
    // script/style/noscript/template content dropped. Title is "Untitled"
    // when the document has none.
    static Extracted extract(const std::string& html);

    static std::string to_text(const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Umbra
