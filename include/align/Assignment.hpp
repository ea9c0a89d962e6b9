#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "align/Similarity.hpp"

namespace align {

struct ScoredPair {
    size_t reference_index = 0;  // row in the similarity matrix
    size_t target_index = 0;     // column in the similarity matrix
    double score = 0.0;
};

struct AssignedTarget {
    size_t target_index = 0;
    double score = 0.0;
};

// Partial 1-to-1 mapping between matrix rows and columns.
struct Assignment {
    std::map<size_t, AssignedTarget> by_reference;
    std::set<size_t> used_targets;

    size_t size() const { return by_reference.size(); }
    bool empty() const { return by_reference.empty(); }

    // nullptr when the reference row is unassigned
    const AssignedTarget* find(size_t reference_index) const;
};

// Produces an Assignment from a similarity matrix. The assembler only sees
// this interface, so an optimal matcher can replace the greedy one.
class AssignmentStrategy {
public:
    virtual ~AssignmentStrategy() = default;
    virtual Assignment assign(const SimilarityMatrix& m, double threshold) const = 0;
    virtual const char* name() const = 0;
};

// Accepts pairs in descending score order while both sides are free.
// Ties: lower reference index first, then lower target index.
// Not maximum-weight optimal.
class GreedyAssignment final : public AssignmentStrategy {
public:
    Assignment assign(const SimilarityMatrix& m, double threshold) const override;
    const char* name() const override { return "greedy"; }
};

// Every cell with score >= threshold, sorted for greedy acceptance.
std::vector<ScoredPair> collect_candidates(const SimilarityMatrix& m, double threshold);

Assignment greedy_assign(const SimilarityMatrix& m, double threshold);

}  // namespace align
