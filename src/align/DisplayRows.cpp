#include "align/DisplayRows.hpp"

#include <unordered_map>

namespace align {

const char* row_type_str(RowType t) {
    switch (t) {
        case RowType::ReferenceAligned: return "ReferenceAligned";
        case RowType::UnmatchedTarget: return "UnmatchedTarget";
        default: return "ReferenceAligned";
    }
}

static std::unordered_map<int, const ContentRecord*> index_records(const std::vector<ContentRecord>* records) {
    std::unordered_map<int, const ContentRecord*> out;
    if (!records) return out;
    out.reserve(records->size() * 2 + 8);
    for (const auto& r : *records) out.emplace(r.original_index, &r);
    return out;
}

// Text shown for a target row: the pre-translation content when we have it.
static std::string original_text(const ContentRecord& t,
                                 const std::unordered_map<int, const ContentRecord*>& originals) {
    auto it = originals.find(t.original_index);
    if (it != originals.end()) return it->second->raw_text;
    return t.raw_text;
}

static std::string translated_text(const ContentRecord& t, const DisplayContext& ctx) {
    if (!ctx.translations) return "";
    auto it = ctx.translations->find(t.original_index);
    if (it == ctx.translations->end()) return "";
    return it->second;
}

std::vector<DisplayRow> build_display_rows(
    const std::vector<ContentRecord>& reference,
    const AlignmentResult& result,
    const DisplayContext& ctx
) {
    const auto refs = index_records(&reference);
    const auto originals = index_records(ctx.original_targets);

    std::vector<DisplayRow> out;
    out.reserve(result.rows.size() + result.leftover_targets.size());

    for (const auto& row : result.rows) {
        DisplayRow d;
        d.type = RowType::ReferenceAligned;
        d.ref_line = row.reference_index + 1;

        auto rit = refs.find(row.reference_index);
        if (rit != refs.end()) {
            d.ref_id = rit->second->id;
            d.ref_content = rit->second->raw_text;
        }

        if (row.has_match()) {
            const ContentRecord& t = *row.target;
            d.target_line = t.original_index + 1;
            d.target_id = t.id;
            d.target_content = original_text(t, originals);
            d.translated_content = translated_text(t, ctx);
            d.status = "Matched";
        } else {
            d.status = "Missing";
        }

        d.score = row.score;
        d.quality = classify_quality(row.score);
        out.push_back(std::move(d));
    }

    // leftover_targets is already ascending by original_index
    for (const auto& t : result.leftover_targets) {
        DisplayRow d;
        d.type = RowType::UnmatchedTarget;
        d.target_line = t.original_index + 1;
        d.target_id = t.id;
        d.target_content = original_text(t, originals);
        d.translated_content = translated_text(t, ctx);
        d.status = "Unmatched Target";
        d.quality = QualityBand::Poor;
        out.push_back(std::move(d));
    }

    return out;
}

std::vector<ReorderedRow> reordered_targets(
    const std::vector<ContentRecord>& reference,
    const AlignmentResult& result,
    bool placeholder,
    const DisplayContext& ctx
) {
    const auto refs = index_records(&reference);
    const auto originals = index_records(ctx.original_targets);

    std::vector<ReorderedRow> out;
    out.reserve(result.rows.size());

    for (const auto& row : result.rows) {
        if (row.has_match()) {
            out.push_back({row.target->id, original_text(*row.target, originals)});
            continue;
        }

        if (!placeholder) {
            out.push_back({"", ""});
            continue;
        }

        std::string ref_id;
        std::string ref_text;
        auto rit = refs.find(row.reference_index);
        if (rit != refs.end()) {
            ref_id = rit->second->id;
            ref_text = rit->second->raw_text;
        }
        out.push_back({"UNMATCHED_" + ref_id, "[NO MATCH FOR: " + ref_text + "]"});
    }

    return out;
}

}  // namespace align
