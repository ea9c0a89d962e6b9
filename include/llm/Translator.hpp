#pragma once
#include <map>
#include <string>
#include <vector>

#include "align/Models.hpp"

namespace llm {

struct TranslationResult {
    std::string id;
    int original_index = 0;
    std::string translated;
};

class Translator {
public:
    virtual ~Translator() = default;

    // Rows the translator could not handle are simply absent from the result.
    virtual std::vector<TranslationResult> translate_batch(const std::vector<align::ContentRecord>& rows,
                                                           const std::string& source_lang,
                                                           const std::string& target_lang) = 0;
    virtual std::string name() const = 0;
};

class NullTranslator final : public Translator {
public:
    std::vector<TranslationResult> translate_batch(const std::vector<align::ContentRecord>& rows,
                                                   const std::string&, const std::string&) override {
        std::vector<TranslationResult> out;
        out.reserve(rows.size());
        for (const auto& r : rows) out.push_back({r.id, r.original_index, r.raw_text});
        return out;
    }
    std::string name() const override { return "null"; }
};

// New records with raw_text replaced by the translation matching their
// original_index. id and original_index are kept; clean_text and embedding
// are cleared since they describe the old text.
std::vector<align::ContentRecord> apply_translations(const std::vector<align::ContentRecord>& records,
                                                     const std::vector<TranslationResult>& results);

// original_index -> translated text, for display lookups.
std::map<int, std::string> translation_map(const std::vector<TranslationResult>& results);

} // namespace llm
