#include "align/AlignmentArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace align {

template <typename T>
static nlohmann::json opt_json(const std::optional<T>& v) {
    if (!v) return nullptr;
    return *v;
}

static nlohmann::json display_row_to_json(const DisplayRow& r) {
    nlohmann::json j;
    j["row_type"] = row_type_str(r.type);
    j["ref_line"] = opt_json(r.ref_line);
    j["ref_id"] = r.ref_id;
    j["ref_content"] = r.ref_content;
    j["target_line"] = opt_json(r.target_line);
    j["target_id"] = r.target_id;
    j["target_content"] = r.target_content;
    if (!r.translated_content.empty()) j["translated_content"] = r.translated_content;
    j["status"] = r.status;
    j["similarity"] = opt_json(r.score);
    j["quality"] = quality_str(r.quality);
    return j;
}

static nlohmann::json diagnostic_to_json(const LineDiagnostic& d) {
    nlohmann::json j;
    j["target_line"] = d.position + 1;
    j["target_id"] = d.target.id;
    j["target_content"] = d.target.raw_text;

    if (d.reference) {
        j["ref_line"] = d.reference->original_index + 1;
        j["ref_id"] = d.reference->id;
    } else {
        j["ref_line"] = nullptr;
        j["ref_id"] = nullptr;
    }

    j["line_score"] = opt_json(d.score);
    j["is_good"] = d.is_good;
    j["quality"] = quality_str(d.quality);

    if (d.suggestion) {
        j["suggestion"] = {
            {"ref_line", d.suggestion->reference_index + 1},
            {"ref_id", d.suggestion->reference_id},
            {"similarity", d.suggestion->score},
            {"is_good", d.suggestion->is_good}
        };
    } else {
        j["suggestion"] = nullptr;
    }
    return j;
}

static void write_json_file(const std::filesystem::path& out_path, const nlohmann::json& j) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
}

nlohmann::json AlignmentArtifact::to_json() const {
    nlohmann::json j;
    j["reference_path"] = reference_path;
    j["target_path"] = target_path;

    j["config"] = {
        {"threshold", threshold},
        {"strategy", strategy},
        {"translated", translated}
    };

    j["statistics"] = {
        {"total_reference", stats.total_reference},
        {"matched", stats.matched},
        {"missing", stats.total_reference - stats.matched},
        {"leftover", leftover_count},
        {"high", stats.high},
        {"medium", stats.medium},
        {"low", stats.low},
        {"poor", stats.poor},
        {"match_percentage", stats.match_percentage},
        {"average_score", stats.average_score}
    };

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : rows) arr.push_back(display_row_to_json(r));
    j["rows"] = arr;

    return j;
}

void AlignmentArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

nlohmann::json LineByLineArtifact::to_json() const {
    nlohmann::json j;
    j["reference_path"] = reference_path;
    j["target_path"] = target_path;
    j["config"] = {{"threshold", threshold}};

    j["summary"] = {
        {"total_targets", summary.total_targets},
        {"positional_pairs", summary.positional_pairs},
        {"good", summary.good},
        {"with_suggestion", summary.with_suggestion},
        {"high", summary.high},
        {"medium", summary.medium},
        {"low", summary.low},
        {"poor", summary.poor},
        {"good_percentage", summary.good_percentage},
        {"average_score", summary.average_score}
    };

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : diagnostics) arr.push_back(diagnostic_to_json(d));
    j["diagnostics"] = arr;

    return j;
}

void LineByLineArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

}  // namespace align
