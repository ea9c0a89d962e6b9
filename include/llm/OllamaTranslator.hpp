#pragma once

#include "llm/Translator.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace llm {

// Translates one row per request through a local Ollama server
// (http://127.0.0.1:11434, reached with curl). Answers are cached on disk.
class OllamaTranslator final : public Translator {
    std::string model_;
    std::filesystem::path cache_dir_;
    std::string endpoint_;
    bool cache_only_ = false;

public:
    OllamaTranslator(const std::string& model, const std::string& cache_dir,
                     const std::string& endpoint = "http://127.0.0.1:11434/api/generate");

    std::vector<TranslationResult> translate_batch(const std::vector<align::ContentRecord>& rows,
                                                   const std::string& source_lang,
                                                   const std::string& target_lang) override;
    std::string name() const override { return "ollama:" + model_; }

    // Serve cached answers only; rows missing from the cache are skipped
    // without contacting the server.
    void set_cache_only(bool on) { cache_only_ = on; }

private:
    std::string prompt_translate(const std::string& text, const std::string& source_lang,
                                 const std::string& target_lang) const;

    std::string run_ollama_json(const std::string& prompt) const;

    bool load_cache(const std::string& key, std::string& out) const;
    void save_cache(const std::string& key, const std::string& content) const;
};

// "translate_v1-<fnv1a64 hex>" over model, languages and text.
std::string translation_cache_key(const std::string& model, const std::string& source_lang,
                                  const std::string& target_lang, const std::string& text);

// Pulls {"translation": "..."} out of a model answer, tolerating text around
// the object. Empty when nothing usable is found.
std::string parse_translation_json(const std::string& s);

} // namespace llm
