#include "align/Validator.hpp"

#include "nlohmann/json.hpp"

#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace align {

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg,
                      const std::string& record_id = "") {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.record_id = record_id;
    rep.errors.push_back(std::move(e));
}

ValidationReport check_alignment(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    const AlignmentResult& result
) {
    ValidationReport rep;

    if (result.rows.size() != reference.size()) {
        add_error(rep, "row_count_mismatch",
                  "expected " + std::to_string(reference.size()) + " aligned rows, got " +
                  std::to_string(result.rows.size()));
    }

    if (result.matched_count + result.missing_count != result.total_reference ||
        result.total_reference != static_cast<int>(result.rows.size())) {
        add_error(rep, "count_mismatch", "matched + missing != total reference rows");
    }
    if (result.leftover_count != static_cast<int>(result.leftover_targets.size())) {
        add_error(rep, "count_mismatch", "leftover_count disagrees with leftover list");
    }

    for (size_t i = 1; i < result.rows.size(); ++i) {
        if (result.rows[i - 1].reference_index >= result.rows[i].reference_index) {
            add_error(rep, "order_violation",
                      "aligned rows not ascending at reference index " +
                      std::to_string(result.rows[i].reference_index));
        }
    }
    for (size_t i = 1; i < result.leftover_targets.size(); ++i) {
        if (result.leftover_targets[i - 1].original_index >= result.leftover_targets[i].original_index) {
            add_error(rep, "leftover_order_violation", "leftover targets not ascending",
                      result.leftover_targets[i].id);
        }
    }

    // every target row appears once across matched rows + leftovers
    std::unordered_map<int, int> seen;
    seen.reserve(target.size() * 2 + 8);
    for (const auto& row : result.rows) {
        if (row.has_match()) seen[row.target->original_index]++;
    }
    for (const auto& t : result.leftover_targets) seen[t.original_index]++;

    for (const auto& t : target) {
        auto it = seen.find(t.original_index);
        const int n = (it == seen.end()) ? 0 : it->second;
        if (n == 0) add_error(rep, "lost_target", "target row is neither matched nor leftover", t.id);
        if (n > 1) add_error(rep, "duplicate_target", "target row appears more than once", t.id);
    }

    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;

    nlohmann::json errs = nlohmann::json::array();
    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.record_id.empty()) ej["record_id"] = e.record_id;
        errs.push_back(ej);
    }
    j["errors"] = errs;

    std::ofstream out(path);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace align
