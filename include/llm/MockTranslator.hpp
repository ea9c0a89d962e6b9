#pragma once

#include "llm/Translator.hpp"

#include <map>
#include <string>

namespace llm {

// Canned translations keyed by record id, read from
//   {"translations":[{"id":"...","text":"..."}]}   or   {"<id>":"<text>"}
class MockTranslator final : public Translator {
    std::map<std::string, std::string> by_id_;

public:
    // Throws std::runtime_error if the file is missing or malformed.
    explicit MockTranslator(const std::string& path);
    explicit MockTranslator(std::map<std::string, std::string> by_id);

    std::vector<TranslationResult> translate_batch(const std::vector<align::ContentRecord>& rows,
                                                   const std::string& source_lang,
                                                   const std::string& target_lang) override;
    std::string name() const override { return "mock"; }

    size_t size() const { return by_id_.size(); }
};

} // namespace llm
