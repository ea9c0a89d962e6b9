#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "align/DisplayRows.hpp"
#include "align/LineByLine.hpp"
#include "align/Statistics.hpp"

namespace align {

struct AlignmentArtifact {
    std::string reference_path;
    std::string target_path;
    double threshold = 0.5;
    std::string strategy = "greedy";
    bool translated = false;

    MatchingStatistics stats;
    int leftover_count = 0;
    std::vector<DisplayRow> rows;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

struct LineByLineArtifact {
    std::string reference_path;
    std::string target_path;
    double threshold = 0.5;

    LineByLineSummary summary;
    std::vector<LineDiagnostic> diagnostics;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace align
