#pragma once

#include <vector>

#include "align/Aligner.hpp"
#include "align/LineByLine.hpp"

namespace align {

struct MatchingStatistics {
    int total_reference = 0;
    int matched = 0;
    int high = 0;
    int medium = 0;
    int low = 0;
    int poor = 0;                  // includes gap rows
    double match_percentage = 0.0; // matched / total_reference * 100
    double average_score = 0.0;    // over all reference rows, gaps count as 0
};

struct LineByLineSummary {
    int total_targets = 0;
    int positional_pairs = 0;      // rows that had both sides embedded
    int good = 0;
    int with_suggestion = 0;
    int high = 0;
    int medium = 0;
    int low = 0;
    int poor = 0;
    double good_percentage = 0.0;
    double average_score = 0.0;    // over positional_pairs
};

MatchingStatistics compute_statistics(const AlignmentResult& result);

LineByLineSummary summarize(const std::vector<LineDiagnostic>& diagnostics);

}  // namespace align
