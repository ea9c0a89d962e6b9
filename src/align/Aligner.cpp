#include "align/Aligner.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "align/Similarity.hpp"

namespace align {

static ErrorInfo input_error(const std::string& code, const std::string& message,
                             const std::string& details, const std::string& action) {
    ErrorInfo e;
    e.category = ErrorCategory::InputValidation;
    e.severity = ErrorSeverity::High;
    e.code = code;
    e.message = message;
    e.details = details;
    e.suggested_action = action;
    return e;
}

static std::optional<int> first_duplicate_index(const std::vector<ContentRecord>& records) {
    std::unordered_set<int> seen;
    seen.reserve(records.size() * 2 + 8);
    for (const auto& r : records) {
        if (!seen.insert(r.original_index).second) return r.original_index;
    }
    return std::nullopt;
}

std::optional<ErrorInfo> validate_inputs(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    double threshold
) {
    if (reference.empty()) {
        return input_error("empty_reference", "no reference rows to compare",
                           "reference record list is empty",
                           "make sure the reference file has data rows");
    }
    if (target.empty()) {
        return input_error("empty_target", "no target rows to compare",
                           "target record list is empty",
                           "make sure the target file has data rows");
    }
    if (std::isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
        std::ostringstream oss;
        oss << "threshold=" << threshold;
        return input_error("threshold_out_of_range", "similarity threshold must be between 0.0 and 1.0",
                           oss.str(), "pass a threshold in [0, 1]");
    }
    if (auto dup = first_duplicate_index(reference)) {
        return input_error("duplicate_original_index", "reference rows share an original index",
                           "original_index=" + std::to_string(*dup),
                           "assign original_index as 0,1,2,... in source order");
    }
    if (auto dup = first_duplicate_index(target)) {
        return input_error("duplicate_original_index", "target rows share an original index",
                           "original_index=" + std::to_string(*dup),
                           "assign original_index as 0,1,2,... in source order");
    }
    return std::nullopt;
}

AlignmentResult assemble_alignment(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    const std::vector<const ContentRecord*>& embedded_refs,
    const std::vector<const ContentRecord*>& embedded_targets,
    const Assignment& assignment
) {
    // original_index -> row in the embedded subset. Never compare addresses:
    // callers routinely rebuild records (e.g. after translation).
    std::unordered_map<int, size_t> ref_row_by_index;
    ref_row_by_index.reserve(embedded_refs.size() * 2 + 8);
    for (size_t i = 0; i < embedded_refs.size(); ++i) {
        ref_row_by_index.emplace(embedded_refs[i]->original_index, i);
    }

    std::vector<const ContentRecord*> ordered_refs;
    ordered_refs.reserve(reference.size());
    for (const auto& r : reference) ordered_refs.push_back(&r);
    std::stable_sort(ordered_refs.begin(), ordered_refs.end(),
                     [](const ContentRecord* a, const ContentRecord* b) {
                         return a->original_index < b->original_index;
                     });

    AlignmentResult out;
    out.rows.reserve(reference.size());

    std::unordered_set<int> used_target_indexes;
    used_target_indexes.reserve(assignment.size() * 2 + 8);

    for (const ContentRecord* ref : ordered_refs) {
        AlignedRow row;
        row.reference_index = ref->original_index;

        auto rit = ref_row_by_index.find(ref->original_index);
        if (rit != ref_row_by_index.end()) {
            if (const AssignedTarget* hit = assignment.find(rit->second)) {
                const ContentRecord* t = embedded_targets.at(hit->target_index);
                row.target = *t;
                row.score = hit->score;
                used_target_indexes.insert(t->original_index);
            }
        }

        if (row.has_match()) ++out.matched_count;
        else ++out.missing_count;

        out.rows.push_back(std::move(row));
    }

    for (const auto& t : target) {
        if (used_target_indexes.count(t.original_index)) continue;
        out.leftover_targets.push_back(t);
    }
    std::stable_sort(out.leftover_targets.begin(), out.leftover_targets.end(),
                     [](const ContentRecord& a, const ContentRecord& b) {
                         return a.original_index < b.original_index;
                     });

    out.total_reference = static_cast<int>(reference.size());
    out.leftover_count = static_cast<int>(out.leftover_targets.size());
    return out;
}

Outcome<AlignmentResult> align_records(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    const AlignConfig& cfg,
    const AssignmentStrategy* strategy
) {
    if (auto err = validate_inputs(reference, target, cfg.threshold)) {
        return Outcome<AlignmentResult>::failure(*err);
    }

    const GreedyAssignment greedy;
    const AssignmentStrategy& assigner = strategy ? *strategy : greedy;

    try {
        const auto refs = embedded_subset(reference);
        const auto targets = embedded_subset(target);

        const SimilarityMatrix m = build_similarity_matrix(refs, targets);
        const Assignment a = assigner.assign(m, cfg.threshold);

        return Outcome<AlignmentResult>::success(assemble_alignment(reference, target, refs, targets, a));
    } catch (const DimensionMismatch& e) {
        ErrorInfo err;
        err.category = ErrorCategory::DimensionMismatch;
        err.severity = ErrorSeverity::Critical;
        err.code = "dimension_mismatch";
        err.message = "embeddings have inconsistent lengths";
        err.details = e.what();
        err.suggested_action = "regenerate embeddings for both lists with the same model";
        return Outcome<AlignmentResult>::failure(err);
    } catch (const std::exception& e) {
        ErrorInfo err;
        err.category = ErrorCategory::Unexpected;
        err.severity = ErrorSeverity::Critical;
        err.code = "unexpected";
        err.message = "alignment failed";
        err.details = e.what();
        return Outcome<AlignmentResult>::failure(err);
    }
}

}  // namespace align
