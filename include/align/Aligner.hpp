#pragma once

#include <optional>
#include <string>
#include <vector>

#include "align/Assignment.hpp"
#include "align/Errors.hpp"
#include "align/Models.hpp"

namespace align {

struct AlignConfig {
    double threshold = 0.5;  // accept a pair if cosine >= threshold
};

struct AlignedRow {
    int reference_index = 0;                // original_index of the reference record
    std::optional<ContentRecord> target;    // empty for a gap row
    std::optional<double> score;

    bool has_match() const { return target.has_value(); }
};

struct AlignmentResult {
    std::vector<AlignedRow> rows;               // one per reference record, ascending original_index
    std::vector<ContentRecord> leftover_targets; // ascending original_index
    int total_reference = 0;
    int matched_count = 0;
    int missing_count = 0;
    int leftover_count = 0;
};

// Rejects empty lists, thresholds outside [0, 1] and repeated original_index
// values. Returns std::nullopt when the inputs are usable.
std::optional<ErrorInfo> validate_inputs(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    double threshold
);

// Rebuilds one row per reference record from an assignment computed on the
// embedding-bearing subsets. Lookups are keyed by original_index only.
AlignmentResult assemble_alignment(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    const std::vector<const ContentRecord*>& embedded_refs,
    const std::vector<const ContentRecord*>& embedded_targets,
    const Assignment& assignment
);

// Full run: filter -> similarity matrix -> assignment -> assembly.
// Records without an embedding never score; they end up as gaps / leftovers.
// strategy == nullptr uses GreedyAssignment.
Outcome<AlignmentResult> align_records(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    const AlignConfig& cfg = {},
    const AssignmentStrategy* strategy = nullptr
);

}  // namespace align
