#include "commands/align.hpp"
#include "commands/CliArgs.hpp"
#include "commands/prepare.hpp"

#include "align/Aligner.hpp"
#include "align/AlignmentArtifact.hpp"
#include "align/DisplayRows.hpp"
#include "align/Statistics.hpp"
#include "align/Validator.hpp"
#include "io/CsvIO.hpp"

#include <iomanip>
#include <iostream>
#include <string>

static std::string shorten(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    return s.substr(0, n) + "...";
}

static void print_rows(const std::vector<align::DisplayRow>& rows) {
    std::cout << "\n=== aligned rows ===\n";
    for (const auto& r : rows) {
        if (r.type == align::RowType::ReferenceAligned) {
            std::cout << "[" << std::setw(4) << *r.ref_line << "] " << r.ref_id << " -> ";
            if (r.target_line) {
                std::cout << r.target_id << " (line " << *r.target_line << ")  "
                          << std::fixed << std::setprecision(4) << *r.score
                          << "  " << align::quality_str(r.quality) << "\n";
            } else {
                std::cout << "(missing)\n";
            }
            std::cout << "       ref:    " << shorten(r.ref_content, 80) << "\n";
            if (r.target_line) std::cout << "       target: " << shorten(r.target_content, 80) << "\n";
        } else {
            std::cout << "[  --] unmatched target " << r.target_id << " (line " << *r.target_line << ")\n";
            std::cout << "       target: " << shorten(r.target_content, 80) << "\n";
        }
    }
    std::cout << "\n";
}

int cmd_align(int argc, char** argv) {
    const std::string reference = get_arg(argc, argv, "--reference", "");
    const std::string target    = get_arg(argc, argv, "--target", "");

    if (reference.empty() || target.empty()) {
        std::cerr << "error: align requires --reference <csv> and --target <csv>\n";
        return 2;
    }

    align::AppConfig cfg;
    if (!load_effective_config(argc, argv, cfg)) return 2;

    const std::string out_csv   = get_arg(argc, argv, "--out", "out/aligned.csv");
    const std::string out_json  = get_arg(argc, argv, "--json", "");
    const std::string reordered = get_arg(argc, argv, "--reordered", "");
    const std::string report    = get_arg(argc, argv, "--report", "");

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

        align::AlignConfig acfg;
        acfg.threshold = cfg.matching.similarity_threshold;
        align::GreedyAssignment strategy;

        auto outcome = align::align_records(ref.records, tgt.records, acfg, &strategy);
        if (!outcome.ok) {
            report_failure("align", outcome.error);
            return 1;
        }
        const align::AlignmentResult& result = outcome.value;

        auto rep = align::check_alignment(ref.records, tgt.records, result);
        if (!report.empty()) align::write_validation_report(report, rep);
        if (!rep.pass) {
            std::cerr << "align failed: result did not pass validation\n";
            for (const auto& e : rep.errors) {
                std::cerr << "  [" << e.code << "] " << e.message;
                if (!e.record_id.empty()) std::cerr << " (id=" << e.record_id << ")";
                std::cerr << "\n";
            }
            return 1;
        }

        align::DisplayContext ctx;
        ctx.original_targets = &tgt.original_records;
        if (tgt_in.translate) ctx.translations = &tgt.translations;

        const auto rows = align::build_display_rows(ref.records, result, ctx);
        const auto stats = align::compute_statistics(result);

        if (cfg.output.show_detailed_results) print_rows(rows);

        align::write_aligned_csv(out_csv, rows);

        if (!reordered.empty()) {
            align::write_content_csv(reordered, align::reordered_targets(
                ref.records, result, cfg.output.export_unmatched_as_placeholder, ctx));
        }

        if (!out_json.empty()) {
            align::AlignmentArtifact art;
            art.reference_path = reference;
            art.target_path = target;
            art.threshold = acfg.threshold;
            art.strategy = strategy.name();
            art.translated = tgt_in.translate;
            art.stats = stats;
            art.leftover_count = result.leftover_count;
            art.rows = rows;
            art.write_to(out_json);
        }

        std::cout << "REFERENCE: " << reference << "\n";
        std::cout << "TARGET: " << target << "\n";
        std::cout << "THRESHOLD: " << acfg.threshold << "\n";
        std::cout << "TOTAL_REFERENCE: " << stats.total_reference << "\n";
        std::cout << "MATCHED: " << stats.matched << "\n";
        std::cout << "MISSING: " << result.missing_count << "\n";
        std::cout << "LEFTOVER: " << result.leftover_count << "\n";
        std::cout << "QUALITY: high=" << stats.high << " medium=" << stats.medium
                  << " low=" << stats.low << " poor=" << stats.poor << "\n";
        std::cout << "MATCH_PCT: " << std::fixed << std::setprecision(1) << stats.match_percentage << "\n";
        std::cout << "AVG_SCORE: " << std::setprecision(4) << stats.average_score << "\n";
        std::cout << "OUT_CSV: " << out_csv << "\n";
        if (!reordered.empty()) std::cout << "OUT_REORDERED: " << reordered << "\n";
        if (!out_json.empty()) std::cout << "OUT_JSON: " << out_json << "\n";
        if (!report.empty()) std::cout << "OUT_REPORT: " << report << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "align failed: " << e.what() << "\n";
        return 1;
    }
}
