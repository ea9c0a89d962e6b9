#include "align/Assignment.hpp"

#include <algorithm>

namespace align {

const AssignedTarget* Assignment::find(size_t reference_index) const {
    auto it = by_reference.find(reference_index);
    if (it == by_reference.end()) return nullptr;
    return &it->second;
}

static bool candidate_before(const ScoredPair& a, const ScoredPair& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.reference_index != b.reference_index) return a.reference_index < b.reference_index;
    return a.target_index < b.target_index;
}

std::vector<ScoredPair> collect_candidates(const SimilarityMatrix& m, double threshold) {
    std::vector<ScoredPair> out;
    if (m.empty()) return out;

    for (size_t i = 0; i < m.rows(); ++i) {
        for (size_t j = 0; j < m.cols(); ++j) {
            const double s = m.at(i, j);
            if (s >= threshold) out.push_back({i, j, s});
        }
    }

    // total order, so the result does not depend on sort stability
    std::sort(out.begin(), out.end(), candidate_before);
    return out;
}

Assignment greedy_assign(const SimilarityMatrix& m, double threshold) {
    Assignment a;

    for (const auto& c : collect_candidates(m, threshold)) {
        if (a.by_reference.count(c.reference_index)) continue;
        if (a.used_targets.count(c.target_index)) continue;

        a.by_reference[c.reference_index] = AssignedTarget{c.target_index, c.score};
        a.used_targets.insert(c.target_index);

        if (a.size() == m.rows() || a.used_targets.size() == m.cols()) break;
    }

    return a;
}

Assignment GreedyAssignment::assign(const SimilarityMatrix& m, double threshold) const {
    return greedy_assign(m, threshold);
}

}  // namespace align
