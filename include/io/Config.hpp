#pragma once
#include <string>
#include <vector>

#include "text/TextCleaner.hpp"

namespace align {

struct MatchingConfig {
    double similarity_threshold = 0.5;
    int row_limit = 0;  // 0 = all rows
    int min_content_length = 3;
    int max_content_length = 8000;
};

struct OutputConfig {
    bool show_detailed_results = true;
    bool export_unmatched_as_placeholder = true;
};

struct EmbeddingConfig {
    std::string model = "models/emb/model.onnx";
    std::string vocab = "models/emb/vocab.txt";
    int max_tokens = 256;
    int intra_op_threads = 1;
};

struct TranslationConfig {
    bool enabled = false;
    std::string source_lang;
    std::string target_lang = "en";
    std::string model = "llama3.1:8b";
    std::string cache_dir = "out/translate_cache";
    std::string mock_file;
};

struct AppConfig {
    MatchingConfig matching;
    textutil::CleanOptions preprocessing;
    OutputConfig output;
    EmbeddingConfig embedding;
    TranslationConfig translation;
};

// Missing keys keep their defaults. Throws std::runtime_error on unreadable
// files, malformed JSON or wrong value types.
AppConfig load_config(const std::string& path);
AppConfig parse_config(const std::string& json_text, const std::string& where = "config");

// Empty when the config is usable; otherwise one message per problem.
std::vector<std::string> validate_config(const AppConfig& cfg);

}  // namespace align
