#pragma once

#include <optional>
#include <string>
#include <vector>

#include "align/Errors.hpp"
#include "align/Models.hpp"
#include "align/Quality.hpp"

namespace align {

// Best reference row for a weak positional pair. Non-binding: the same
// reference row may be suggested for several targets.
struct Suggestion {
    int reference_index = 0;  // original_index of the suggested reference record
    std::string reference_id;
    std::string reference_content;
    double score = 0.0;
    bool is_good = false;     // score >= threshold
};

struct LineDiagnostic {
    int position = 0;                   // 0-based row in the target list
    ContentRecord target;
    std::optional<ContentRecord> reference;  // positional counterpart; empty past the end of reference
    std::optional<double> score;        // empty if either side has no embedding
    bool is_good = false;
    QualityBand quality = QualityBand::Poor;
    std::optional<Suggestion> suggestion;
};

// Compares reference[i] with target[i]. Weak pairs and trailing extra
// targets get the single best reference row as a suggestion.
Outcome<std::vector<LineDiagnostic>> line_by_line(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    double threshold
);

// Highest-scoring embedded reference for one target vector; first index wins
// ties. std::nullopt when nothing can be scored.
std::optional<Suggestion> best_reference_for(
    const std::vector<float>& target_embedding,
    const std::vector<const ContentRecord*>& embedded_refs,
    double threshold
);

// Puts back the pre-translation text of each diagnostic's target, matched by
// original_index. Targets with no original keep their text.
void restore_original_text(
    std::vector<LineDiagnostic>& diagnostics,
    const std::vector<ContentRecord>& originals
);

}  // namespace align
