#include "emb/EmbeddingProvider.hpp"

#include <exception>
#include <iostream>

#include "text/TextCleaner.hpp"

namespace align {

EmbedStats attach_embeddings(
    std::vector<ContentRecord>& records,
    const EmbeddingProvider& provider,
    size_t min_len,
    size_t max_len
) {
    EmbedStats st;
    size_t dim = 0;

    for (auto& r : records) {
        r.embedding.reset();

        if (!textutil::is_content_valid(r.clean_text, min_len, max_len)) {
            std::cerr << "embed: skipped id=" << r.id << " (invalid content)\n";
            ++st.skipped;
            continue;
        }

        ++st.attempted;

        std::vector<float> v;
        try {
            v = provider.embed(r.clean_text);
        } catch (const std::exception& e) {
            std::cerr << "embed: skipped id=" << r.id << " (" << provider.name() << ": " << e.what() << ")\n";
            ++st.skipped;
            continue;
        }

        if (v.empty()) {
            std::cerr << "embed: skipped id=" << r.id << " (" << provider.name() << " returned no vector)\n";
            ++st.skipped;
            continue;
        }
        if (dim == 0) {
            dim = v.size();
        } else if (v.size() != dim) {
            std::cerr << "embed: skipped id=" << r.id << " (dimension " << v.size()
                      << " != " << dim << ")\n";
            ++st.skipped;
            continue;
        }

        r.embedding = std::move(v);
        ++st.embedded;
    }

    return st;
}

}  // namespace align
