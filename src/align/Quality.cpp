#include "align/Quality.hpp"

namespace align {

QualityBand classify_quality(double score) {
    if (score >= 0.8) return QualityBand::High;
    if (score >= 0.6) return QualityBand::Medium;
    if (score >= 0.4) return QualityBand::Low;
    return QualityBand::Poor;  // also NaN
}

QualityBand classify_quality(const std::optional<double>& score) {
    if (!score) return QualityBand::Poor;
    return classify_quality(*score);
}

const char* quality_str(QualityBand q) {
    switch (q) {
        case QualityBand::High: return "High";
        case QualityBand::Medium: return "Medium";
        case QualityBand::Low: return "Low";
        case QualityBand::Poor: return "Poor";
        default: return "Poor";
    }
}

}  // namespace align
