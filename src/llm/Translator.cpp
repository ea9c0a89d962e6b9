#include "llm/Translator.hpp"

namespace llm {

std::vector<align::ContentRecord> apply_translations(const std::vector<align::ContentRecord>& records,
                                                     const std::vector<TranslationResult>& results) {
    const auto by_index = translation_map(results);

    std::vector<align::ContentRecord> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        align::ContentRecord copy = r;
        auto it = by_index.find(r.original_index);
        if (it != by_index.end() && it->second != r.raw_text) {
            copy.raw_text = it->second;
            copy.clean_text.clear();
            copy.embedding.reset();
        }
        out.push_back(std::move(copy));
    }
    return out;
}

std::map<int, std::string> translation_map(const std::vector<TranslationResult>& results) {
    std::map<int, std::string> m;
    for (const auto& t : results) m[t.original_index] = t.translated;
    return m;
}

} // namespace llm
