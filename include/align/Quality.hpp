#pragma once
#include <optional>
#include <string>

namespace align {

enum class QualityBand {
    Poor,
    Low,
    Medium,
    High
};

// High >= 0.8, Medium >= 0.6, Low >= 0.4, else Poor. No score is Poor.
QualityBand classify_quality(double score);
QualityBand classify_quality(const std::optional<double>& score);

const char* quality_str(QualityBand q);

}  // namespace align
