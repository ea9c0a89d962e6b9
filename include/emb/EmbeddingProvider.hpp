#pragma once
#include <string>
#include <vector>

#include "align/Models.hpp"

namespace align {

// Anything that turns a cleaned text into a fixed-length vector.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // Empty vector on failure.
    virtual std::vector<float> embed(const std::string& text) const = 0;
    virtual std::string name() const = 0;
};

struct EmbedStats {
    size_t attempted = 0;
    size_t embedded = 0;
    size_t skipped = 0;
};

// Embeds every record whose clean_text passes is_content_valid. Failed
// records keep an empty embedding and are logged to stderr; the batch
// always runs to the end. A vector whose length differs from the first
// accepted one is rejected.
EmbedStats attach_embeddings(
    std::vector<ContentRecord>& records,
    const EmbeddingProvider& provider,
    size_t min_len = 3,
    size_t max_len = 8000
);

}  // namespace align
