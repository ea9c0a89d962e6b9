#pragma once
#include <cstddef>
#include <vector>

#include "align/Models.hpp"

namespace align {

// Cosine similarity in [-1, 1], accumulated in double precision.
// Throws DimensionMismatch if the lengths differ; returns 0 if either vector
// has zero magnitude.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// R x T scores for two embedding-bearing record lists.
class SimilarityMatrix {
public:
    SimilarityMatrix() = default;
    SimilarityMatrix(size_t rows, size_t cols);

    size_t rows() const { return m_rows; }
    size_t cols() const { return m_cols; }
    bool empty() const { return m_rows == 0 || m_cols == 0; }

    double at(size_t i, size_t j) const { return m_data[i * m_cols + j]; }
    void set(size_t i, size_t j, double v) { m_data[i * m_cols + j] = v; }

private:
    size_t m_rows = 0;
    size_t m_cols = 0;
    std::vector<double> m_data;  // row-major
};

// matrix(i, j) = cosine(refs[i].embedding, targets[j].embedding).
// Cost is O(R * T * D); this dominates an alignment run. Every record passed
// here must carry an embedding (filter with embedded_subset first).
SimilarityMatrix build_similarity_matrix(
    const std::vector<const ContentRecord*>& refs,
    const std::vector<const ContentRecord*>& targets
);

// Records that carry an embedding, in list order.
std::vector<const ContentRecord*> embedded_subset(const std::vector<ContentRecord>& records);

}  // namespace align
