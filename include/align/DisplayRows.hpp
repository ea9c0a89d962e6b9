#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "align/Aligner.hpp"
#include "align/Quality.hpp"

namespace align {

enum class RowType {
    ReferenceAligned,
    UnmatchedTarget
};

struct DisplayRow {
    RowType type = RowType::ReferenceAligned;

    std::optional<int> ref_line;     // 1-based; empty for UnmatchedTarget
    std::string ref_id;
    std::string ref_content;

    std::optional<int> target_line;  // 1-based; empty for gaps
    std::string target_id;
    std::string target_content;      // pre-translation text
    std::string translated_content;  // empty when no translation ran

    std::string status;              // "Matched" | "Missing" | "Unmatched Target"
    std::optional<double> score;
    QualityBand quality = QualityBand::Poor;
};

// Extra lookups for rows whose target text was replaced before embedding.
// Both maps are keyed by original_index.
struct DisplayContext {
    const std::vector<ContentRecord>* original_targets = nullptr;
    const std::map<int, std::string>* translations = nullptr;
};

const char* row_type_str(RowType t);

// ReferenceAligned rows in reference order, then UnmatchedTarget rows in
// ascending original_index. Export and on-screen tables both read this.
std::vector<DisplayRow> build_display_rows(
    const std::vector<ContentRecord>& reference,
    const AlignmentResult& result,
    const DisplayContext& ctx = {}
);

struct ReorderedRow {
    std::string id;
    std::string content;
};

// Target rows laid out in reference order. Gaps become
// "UNMATCHED_<refId>" placeholders, or empty rows when placeholder == false.
std::vector<ReorderedRow> reordered_targets(
    const std::vector<ContentRecord>& reference,
    const AlignmentResult& result,
    bool placeholder = true,
    const DisplayContext& ctx = {}
);

}  // namespace align
