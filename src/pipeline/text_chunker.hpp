#pragma once
#include <string>
#include <vector>

namespace Umbra {
namespace Pipeline {

// Sizes are in characters, at five characters per word.
class TextChunker {
public:
    // Throws std::invalid_argument when the sizes leave no forward step.
    TextChunker(int chunk_size, int chunk_overlap);

    std::vector<std::string> chunk(const std::string& text) const;

    int words_per_chunk() const {
        return words_per_chunk_;
    }
    int step() const {
        return words_per_chunk_ - overlap_words_;
    }

private:
    int words_per_chunk_;
    int overlap_words_;
};

}  // namespace Pipeline
}  // namespace Umbra
