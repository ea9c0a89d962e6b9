#pragma once
#include <optional>
#include <string>
#include <vector>

namespace align {

struct ContentRecord {
    std::string id;                  // ContentId column, not guaranteed unique
    std::string raw_text;            // cell text as read (may contain HTML)
    std::string clean_text;          // filled by the text cleaner
    int original_index = 0;          // 0-based source row; the only identity used for lookups
    std::optional<std::vector<float>> embedding;  // attached by an embedding provider

    bool has_embedding() const { return embedding.has_value() && !embedding->empty(); }
};

}  // namespace align
