#pragma once
#include "emb/EmbeddingProvider.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

class MiniLmEmbedder final : public align::EmbeddingProvider {
public:
    explicit MiniLmEmbedder(size_t max_tokens = 256, int intra_op_threads = 1);

    bool init(const std::string& model_path, const std::string& vocab_path);

    // L2-normalized mean-pooled embedding; empty if not initialized
    std::vector<float> embed(const std::string& text) const override;
    std::string name() const override { return "minilm"; }

private:
    size_t m_max_tokens;
    int m_threads;

    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "content-align"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::vector<std::string> m_in_names;
    std::string m_out_name;
};
