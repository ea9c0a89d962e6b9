#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "align/Aligner.hpp"

namespace align {

struct ValidationError {
    std::string code;
    std::string message;
    std::string record_id;
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

// Re-checks an AlignmentResult against the lists it was built from:
// count invariants, one row per reference record in ascending order,
// every embedded target used exactly once, leftovers ascending.
ValidationReport check_alignment(
    const std::vector<ContentRecord>& reference,
    const std::vector<ContentRecord>& target,
    const AlignmentResult& result
);

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace align
