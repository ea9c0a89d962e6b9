#include "commands/lines.hpp"
#include "commands/CliArgs.hpp"
#include "commands/prepare.hpp"

#include "align/AlignmentArtifact.hpp"
#include "align/LineByLine.hpp"
#include "align/Statistics.hpp"
#include "io/CsvIO.hpp"

#include <iomanip>
#include <iostream>
#include <string>

static void print_diagnostics(const std::vector<align::LineDiagnostic>& diags) {
    std::cout << "\n=== line by line ===\n";
    for (const auto& d : diags) {
        std::cout << "[" << std::setw(4) << d.position + 1 << "] " << d.target.id << "  ";
        if (!d.reference) {
            std::cout << "(no reference row)";
        } else if (d.score) {
            std::cout << "vs " << d.reference->id << "  " << std::fixed << std::setprecision(4) << *d.score
                      << "  " << align::quality_str(d.quality) << (d.is_good ? "" : "  REVIEW");
        } else {
            std::cout << "vs " << d.reference->id << "  (not scored)";
        }
        std::cout << "\n";

        if (d.suggestion && !d.is_good) {
            std::cout << "       suggest ref line " << d.suggestion->reference_index + 1
                      << " (" << d.suggestion->reference_id << ")  "
                      << std::fixed << std::setprecision(4) << d.suggestion->score << "\n";
        }
    }
    std::cout << "\n";
}

int cmd_lines(int argc, char** argv) {
    const std::string reference = get_arg(argc, argv, "--reference", "");
    const std::string target    = get_arg(argc, argv, "--target", "");

    if (reference.empty() || target.empty()) {
        std::cerr << "error: lines requires --reference <csv> and --target <csv>\n";
        return 2;
    }

    align::AppConfig cfg;
    if (!load_effective_config(argc, argv, cfg)) return 2;

    const std::string out_csv  = get_arg(argc, argv, "--out", "out/line_by_line.csv");
    const std::string out_json = get_arg(argc, argv, "--json", "");

    try {
        SideInputs ref_in;
        ref_in.csv_path = reference;
        ref_in.store_path = get_arg(argc, argv, "--ref_emb", "");

        SideInputs tgt_in;
        tgt_in.csv_path = target;
        tgt_in.store_path = get_arg(argc, argv, "--target_emb", "");
        tgt_in.translate = cfg.translation.enabled || !cfg.translation.mock_file.empty();

        PreparedSide ref = prepare_side(ref_in, cfg, "reference", "");
        PreparedSide tgt = prepare_side(tgt_in, cfg, "target", cfg.translation.mock_file);

        const double threshold = cfg.matching.similarity_threshold;
        auto outcome = align::line_by_line(ref.records, tgt.records, threshold);
        if (!outcome.ok) {
            report_failure("lines", outcome.error);
            return 1;
        }

        // report the text as it was in the CSV
        auto diags = outcome.value;
        align::restore_original_text(diags, tgt.original_records);

        const auto summary = align::summarize(diags);

        if (cfg.output.show_detailed_results) print_diagnostics(diags);

        align::write_line_by_line_csv(out_csv, diags);

        if (!out_json.empty()) {
            align::LineByLineArtifact art;
            art.reference_path = reference;
            art.target_path = target;
            art.threshold = threshold;
            art.summary = summary;
            art.diagnostics = diags;
            art.write_to(out_json);
        }

        std::cout << "REFERENCE: " << reference << "\n";
        std::cout << "TARGET: " << target << "\n";
        std::cout << "THRESHOLD: " << threshold << "\n";
        std::cout << "TOTAL_TARGETS: " << summary.total_targets << "\n";
        std::cout << "SCORED_PAIRS: " << summary.positional_pairs << "\n";
        std::cout << "GOOD: " << summary.good << "\n";
        std::cout << "WITH_SUGGESTION: " << summary.with_suggestion << "\n";
        std::cout << "GOOD_PCT: " << std::fixed << std::setprecision(1) << summary.good_percentage << "\n";
        std::cout << "AVG_SCORE: " << std::setprecision(4) << summary.average_score << "\n";
        std::cout << "OUT_CSV: " << out_csv << "\n";
        if (!out_json.empty()) std::cout << "OUT_JSON: " << out_json << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "lines failed: " << e.what() << "\n";
        return 1;
    }
}
