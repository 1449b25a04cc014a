#include "converter.hpp"
#include <gumbo.h>
#include <string>
#include <vector>
#include "string_utils.hpp"

namespace Umbra {
namespace Utils {
namespace Text {

namespace {

bool is_hidden(GumboTag tag) {
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT
           || tag == GUMBO_TAG_TEMPLATE;
}

void collect_text(GumboNode* node, std::vector<std::string>& parts) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA) {
        std::string piece = trim(node->v.text.text);
        if (!piece.empty())
            parts.push_back(std::move(piece));
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT)
        return;
    if (node->type == GUMBO_NODE_ELEMENT && is_hidden(node->v.element.tag))
        return;

    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
                                      ? &node->v.document.children
                                      : &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<GumboNode*>(children->data[i]), parts);
    }
}

GumboNode* find_title(GumboNode* node) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return nullptr;
    if (node->v.element.tag == GUMBO_TAG_TITLE)
        return node;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        if (GumboNode* found = find_title(static_cast<GumboNode*>(children->data[i])))
            return found;
    }
    return nullptr;
}

}  // namespace

Converter::Extracted Converter::extract(const std::string& html) {
    Extracted result{"Untitled", ""};
    if (html.empty())
        return result;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());

    if (GumboNode* title = find_title(output->root)) {
        std::vector<std::string> title_parts;
        collect_text(title, title_parts);
        std::string value = collapse_whitespace(join(title_parts, 0, title_parts.size(), " "));
        if (!value.empty())
            result.title = value;
    }

    std::vector<std::string> parts;
    collect_text(output->root, parts);
    result.text = collapse_whitespace(join(parts, 0, parts.size(), " "));

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return result;
}

std::string Converter::to_text(const std::string& html) {
    return extract(html).text;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Umbra
