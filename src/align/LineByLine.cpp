#include "align/LineByLine.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_map>

#include "align/Aligner.hpp"
#include "align/Similarity.hpp"

namespace align {

std::optional<Suggestion> best_reference_for(
    const std::vector<float>& target_embedding,
    const std::vector<const ContentRecord*>& embedded_refs,
    double threshold
) {
    if (target_embedding.empty()) return std::nullopt;

    const ContentRecord* best = nullptr;
    double best_score = -1.0;

    for (const ContentRecord* r : embedded_refs) {
        const double s = cosine_similarity(*r->embedding, target_embedding);
        if (!best || s > best_score) {
            best = r;
            best_score = s;
        }
    }

    if (!best) return std::nullopt;

    Suggestion sg;
    sg.reference_index = best->original_index;
    sg.reference_id = best->id;
    sg.reference_content = best->raw_text;
    sg.score = best_score;
    sg.is_good = best_score >= threshold;
    return sg;
}

Outcome<std::vector<LineDiagnostic>> line_by_line(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    double threshold
) {
    using Result = Outcome<std::vector<LineDiagnostic>>;

    if (auto err = validate_inputs(reference, target, threshold)) {
        return Result::failure(*err);
    }

    if (reference.size() != target.size()) {
        std::cerr << "line-by-line: reference has " << reference.size() << " rows, target has "
                  << target.size() << "; comparing the first " << std::min(reference.size(), target.size())
                  << " positionally\n";
    }

    try {
        const auto refs = embedded_subset(reference);

        std::vector<LineDiagnostic> out;
        out.reserve(target.size());

        for (size_t i = 0; i < target.size(); ++i) {
            const ContentRecord& t = target[i];

            LineDiagnostic d;
            d.position = static_cast<int>(i);
            d.target = t;

            if (i < reference.size()) {
                const ContentRecord& r = reference[i];
                d.reference = r;
                if (r.has_embedding() && t.has_embedding()) {
                    d.score = cosine_similarity(*r.embedding, *t.embedding);
                    d.is_good = *d.score >= threshold;
                }
            }

            d.quality = classify_quality(d.score);

            // fresh, unconstrained search per row; no usage bookkeeping
            if (!d.is_good && t.has_embedding()) {
                d.suggestion = best_reference_for(*t.embedding, refs, threshold);
            }

            out.push_back(std::move(d));
        }

        return Result::success(std::move(out));
    } catch (const DimensionMismatch& e) {
        ErrorInfo err;
        err.category = ErrorCategory::DimensionMismatch;
        err.severity = ErrorSeverity::Critical;
        err.code = "dimension_mismatch";
        err.message = "embeddings have inconsistent lengths";
        err.details = e.what();
        err.suggested_action = "regenerate embeddings for both lists with the same model";
        return Result::failure(err);
    } catch (const std::exception& e) {
        ErrorInfo err;
        err.category = ErrorCategory::Unexpected;
        err.severity = ErrorSeverity::Critical;
        err.code = "unexpected";
        err.message = "line-by-line comparison failed";
        err.details = e.what();
        return Result::failure(err);
    }
}

void restore_original_text(
    std::vector<LineDiagnostic>& diagnostics,
    const std::vector<ContentRecord>& originals
) {
    std::unordered_map<int, const std::string*> text_by_index;
    for (const auto& r : originals) text_by_index.emplace(r.original_index, &r.raw_text);

    for (auto& d : diagnostics) {
        auto it = text_by_index.find(d.target.original_index);
        if (it != text_by_index.end()) d.target.raw_text = *it->second;
    }
}

}  // namespace align
