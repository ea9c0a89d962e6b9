#include "align/Similarity.hpp"

#include <cmath>
#include <stdexcept>

#include "align/Errors.hpp"

namespace align {

static double cosine(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) throw DimensionMismatch(a.size(), b.size());
    if (a.empty()) return 0.0;
    return cosine(a.data(), b.data(), a.size());
}

SimilarityMatrix::SimilarityMatrix(size_t rows, size_t cols)
    : m_rows(rows), m_cols(cols), m_data(rows * cols, 0.0) {}

SimilarityMatrix build_similarity_matrix(
    const std::vector<const ContentRecord*>& refs,
    const std::vector<const ContentRecord*>& targets
) {
    SimilarityMatrix m(refs.size(), targets.size());

    for (size_t i = 0; i < refs.size(); ++i) {
        if (!refs[i] || !refs[i]->has_embedding()) {
            throw std::invalid_argument("build_similarity_matrix: reference record without embedding");
        }
        const std::vector<float>& rv = *refs[i]->embedding;

        for (size_t j = 0; j < targets.size(); ++j) {
            if (!targets[j] || !targets[j]->has_embedding()) {
                throw std::invalid_argument("build_similarity_matrix: target record without embedding");
            }
            m.set(i, j, cosine_similarity(rv, *targets[j]->embedding));
        }
    }

    return m;
}

std::vector<const ContentRecord*> embedded_subset(const std::vector<ContentRecord>& records) {
    std::vector<const ContentRecord*> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        if (r.has_embedding()) out.push_back(&r);
    }
    return out;
}

}  // namespace align
