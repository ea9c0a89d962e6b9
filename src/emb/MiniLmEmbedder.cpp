#include "emb/MiniLmEmbedder.hpp"
#include <cmath>
#include <iostream>

MiniLmEmbedder::MiniLmEmbedder(size_t max_tokens, int intra_op_threads)
    : m_max_tokens(max_tokens), m_threads(intra_op_threads) {}

bool MiniLmEmbedder::init(const std::string& model_path, const std::string& vocab_path) {
    if (!m_tok.load_vocab(vocab_path)) {
        std::cerr << "MiniLmEmbedder: failed to load vocab: " << vocab_path << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(m_threads);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wmodel(model_path.begin(), model_path.end());
        m_session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        auto name_alloc = m_session->GetOutputNameAllocated(0, allocator);
        m_out_name = name_alloc.get();

        // some exports drop token_type_ids
        m_in_names.clear();
        const size_t n_in = m_session->GetInputCount();
        for (size_t i = 0; i < n_in; ++i) {
            auto in = m_session->GetInputNameAllocated(i, allocator);
            m_in_names.emplace_back(in.get());
        }

        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << model_path << "\n";
        m_session.reset();
        return false;
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    if (!m_session) return {};

    std::vector<int64_t> ids = m_tok.encode(text, m_max_tokens);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);

    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<const char*> in_names;
    std::vector<Ort::Value> in_vals;
    for (const auto& n : m_in_names) {
        std::vector<int64_t>* src = nullptr;
        if (n == "input_ids") src = &ids;
        else if (n == "attention_mask") src = &mask;
        else if (n == "token_type_ids") src = &type_ids;
        else {
            std::cerr << "MiniLmEmbedder: unexpected model input: " << n << "\n";
            return {};
        }
        in_names.push_back(n.c_str());
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, src->data(), src->size(), shape.data(), shape.size()));
    }

    const char* out_names[1] = { m_out_name.c_str() };

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(), in_vals.size(), out_names, 1);

    Ort::Value& out = outs[0];
    auto info = out.GetTensorTypeAndShapeInfo();
    auto shp = info.GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3) return {};

    const int64_t hidden = shp[2];
    const float* data = out.GetTensorData<float>();

    std::vector<float> pooled((size_t)hidden, 0.0f);
    double denom = 0.0;

    // output is contiguous as [1, seq_len, hidden]
    for (size_t t = 0; t < seq_len; ++t) {
        if (mask[t] == 0) continue;
        denom += 1.0;
        const float* row = data + (t * (size_t)hidden);
        for (size_t j = 0; j < (size_t)hidden; ++j) pooled[j] += row[j];
    }

    if (denom > 0.0) {
        float inv = (float)(1.0 / denom);
        for (float& x : pooled) x *= inv;
    }

    l2_normalize(pooled);
    return pooled;
}
