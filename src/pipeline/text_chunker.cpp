#include "text_chunker.hpp"
#include <algorithm>
#include <stdexcept>
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"

namespace Umbra {
namespace Pipeline {

using Umbra::Core::Constants;

TextChunker::TextChunker(int chunk_size, int chunk_overlap)
    : words_per_chunk_(chunk_size / Constants::CHARS_PER_WORD),
      overlap_words_(chunk_overlap / Constants::CHARS_PER_WORD) {
    if (words_per_chunk_ <= 0 || overlap_words_ < 0 || words_per_chunk_ <= overlap_words_) {
        throw std::invalid_argument("chunk_size must exceed chunk_overlap by at least "
                                    + std::to_string(Constants::CHARS_PER_WORD) + " characters");
    }
}

std::vector<std::string> TextChunker::chunk(const std::string& text) const {
    std::vector<std::string> words = Utils::Text::split_whitespace(text);
    std::vector<std::string> chunks;

    for (size_t i = 0; i < words.size(); i += static_cast<size_t>(step())) {
        size_t end = std::min(words.size(), i + static_cast<size_t>(words_per_chunk_));
        chunks.push_back(Utils::Text::join(words, i, end, " "));
    }
    return chunks;
}

}  // namespace Pipeline
}  // namespace Umbra
