#include "commands/prepare.hpp"
#include "commands/CliArgs.hpp"

#include "emb/EmbeddingStore.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "io/CsvIO.hpp"
#include "llm/MockTranslator.hpp"
#include "llm/OllamaTranslator.hpp"
#include "text/TextCleaner.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

static const char* kDefaultConfig = "content-align.json";

bool load_effective_config(int argc, char** argv, align::AppConfig& cfg) {
    const std::string explicit_path = get_arg(argc, argv, "--config", "");

    try {
        if (!explicit_path.empty()) {
            cfg = align::load_config(explicit_path);
            std::cerr << "config: " << explicit_path << "\n";
        } else if (fs::exists(kDefaultConfig)) {
            cfg = align::load_config(kDefaultConfig);
            std::cerr << "config: " << kDefaultConfig << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return false;
    }

    if (!read_arg_double(argc, argv, "--threshold", cfg.matching.similarity_threshold)) return false;
    if (!read_arg_int(argc, argv, "--row_limit", cfg.matching.row_limit)) return false;
    if (!read_arg_int(argc, argv, "--max_len", cfg.embedding.max_tokens)) return false;

    cfg.embedding.model = get_arg(argc, argv, "--model", cfg.embedding.model);
    cfg.embedding.vocab = get_arg(argc, argv, "--vocab", cfg.embedding.vocab);

    if (has_flag(argc, argv, "--translate")) cfg.translation.enabled = true;
    cfg.translation.source_lang = get_arg(argc, argv, "--source_lang", cfg.translation.source_lang);
    cfg.translation.target_lang = get_arg(argc, argv, "--target_lang", cfg.translation.target_lang);
    cfg.translation.model = get_arg(argc, argv, "--llm_model", cfg.translation.model);
    cfg.translation.cache_dir = get_arg(argc, argv, "--llm_cache", cfg.translation.cache_dir);
    cfg.translation.mock_file = get_arg(argc, argv, "--translate_mock", cfg.translation.mock_file);

    if (has_flag(argc, argv, "--no_placeholder")) cfg.output.export_unmatched_as_placeholder = false;
    if (has_flag(argc, argv, "--quiet")) cfg.output.show_detailed_results = false;

    const auto problems = align::validate_config(cfg);
    for (const auto& p : problems) std::cerr << "error: " << p << "\n";
    return problems.empty();
}

// With stored embeddings the translation only feeds the display columns, so
// the Ollama translator answers from its cache instead of the server.
static std::unique_ptr<llm::Translator> make_translator(const align::AppConfig& cfg, const std::string& translate_mock,
                                                        bool cache_only) {
    if (!translate_mock.empty()) return std::make_unique<llm::MockTranslator>(translate_mock);
    auto ollama = std::make_unique<llm::OllamaTranslator>(cfg.translation.model, cfg.translation.cache_dir);
    ollama->set_cache_only(cache_only);
    return ollama;
}

PreparedSide prepare_side(const SideInputs& in, const align::AppConfig& cfg, const std::string& label,
                          const std::string& translate_mock) {
    PreparedSide side;

    side.original_records = align::read_content_csv(in.csv_path);
    if (cfg.matching.row_limit > 0 && side.original_records.size() > (size_t)cfg.matching.row_limit) {
        side.original_records.resize((size_t)cfg.matching.row_limit);
    }
    std::cerr << label << ": " << side.original_records.size() << " rows from " << in.csv_path << "\n";

    side.records = side.original_records;

    if (in.translate) {
        auto translator = make_translator(cfg, translate_mock, !in.store_path.empty());
        auto results = translator->translate_batch(side.records, cfg.translation.source_lang,
                                                   cfg.translation.target_lang);
        std::cerr << label << ": translated " << results.size() << "/" << side.records.size()
                  << " rows via " << translator->name() << "\n";
        side.translations = llm::translation_map(results);
        side.records = llm::apply_translations(side.records, results);
    }

    textutil::clean_records(side.records, cfg.preprocessing);

    const size_t min_len = (size_t)cfg.matching.min_content_length;
    const size_t max_len = (size_t)cfg.matching.max_content_length;

    if (!in.store_path.empty()) {
        EmbeddingStore store;
        store.load(in.store_path);
        size_t applied = store.apply_to(side.records);
        // stored vectors only count for rows that would have been embedded
        for (auto& r : side.records) {
            if (r.embedding && !textutil::is_content_valid(r.clean_text, min_len, max_len)) {
                r.embedding.reset();
                --applied;
            }
        }
        std::cerr << label << ": " << applied << " embeddings from " << in.store_path << "\n";
        return side;
    }

    MiniLmEmbedder embedder((size_t)cfg.embedding.max_tokens, cfg.embedding.intra_op_threads);
    if (!embedder.init(cfg.embedding.model, cfg.embedding.vocab)) {
        throw std::runtime_error("failed to init MiniLmEmbedder (model=" + cfg.embedding.model +
                                 ", vocab=" + cfg.embedding.vocab + ")");
    }

    auto st = align::attach_embeddings(side.records, embedder, min_len, max_len);
    std::cerr << label << ": embedded " << st.embedded << "/" << st.attempted
              << " (skipped " << st.skipped << ")\n";
    return side;
}

void report_failure(const std::string& command, const align::ErrorInfo& err) {
    std::cerr << command << " failed: [" << err.code << "] " << err.message << "\n";
    std::cerr << "  category: " << align::category_str(err.category)
              << ", severity: " << align::severity_str(err.severity) << "\n";
    if (!err.details.empty()) std::cerr << "  details: " << err.details << "\n";
    if (!err.suggested_action.empty()) std::cerr << "  suggestion: " << err.suggested_action << "\n";
}
