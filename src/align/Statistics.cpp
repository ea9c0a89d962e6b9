#include "align/Statistics.hpp"

namespace align {

static void count_band(QualityBand q, int& high, int& medium, int& low, int& poor) {
    switch (q) {
        case QualityBand::High: ++high; break;
        case QualityBand::Medium: ++medium; break;
        case QualityBand::Low: ++low; break;
        default: ++poor; break;
    }
}

MatchingStatistics compute_statistics(const AlignmentResult& result) {
    MatchingStatistics st;
    st.total_reference = static_cast<int>(result.rows.size());

    double sum = 0.0;
    for (const auto& row : result.rows) {
        if (row.has_match()) ++st.matched;
        count_band(classify_quality(row.score), st.high, st.medium, st.low, st.poor);
        if (row.score) sum += *row.score;
    }

    if (st.total_reference > 0) {
        st.match_percentage = 100.0 * st.matched / st.total_reference;
        st.average_score = sum / st.total_reference;
    }
    return st;
}

LineByLineSummary summarize(const std::vector<LineDiagnostic>& diagnostics) {
    LineByLineSummary s;
    s.total_targets = static_cast<int>(diagnostics.size());

    double sum = 0.0;
    for (const auto& d : diagnostics) {
        if (d.score) {
            ++s.positional_pairs;
            sum += *d.score;
        }
        if (d.is_good) ++s.good;
        if (d.suggestion) ++s.with_suggestion;
        count_band(d.quality, s.high, s.medium, s.low, s.poor);
    }

    if (s.total_targets > 0) s.good_percentage = 100.0 * s.good / s.total_targets;
    if (s.positional_pairs > 0) s.average_score = sum / s.positional_pairs;
    return s;
}

}  // namespace align
