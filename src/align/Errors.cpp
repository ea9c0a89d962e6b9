#include "align/Errors.hpp"

namespace align {

static std::string mismatch_message(size_t lhs, size_t rhs) {
    return "embedding dimension mismatch: " + std::to_string(lhs) + " vs " + std::to_string(rhs);
}

DimensionMismatch::DimensionMismatch(size_t lhs, size_t rhs)
    : std::runtime_error(mismatch_message(lhs, rhs)), m_lhs(lhs), m_rhs(rhs) {}

const char* category_str(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::InputValidation: return "input_validation";
        case ErrorCategory::DimensionMismatch: return "dimension_mismatch";
        case ErrorCategory::FileAccess: return "file_access";
        case ErrorCategory::DataFormat: return "data_format";
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Collaborator: return "collaborator";
        case ErrorCategory::Unexpected: return "unexpected";
        default: return "unexpected";
    }
}

const char* severity_str(ErrorSeverity s) {
    switch (s) {
        case ErrorSeverity::Low: return "low";
        case ErrorSeverity::Medium: return "medium";
        case ErrorSeverity::High: return "high";
        case ErrorSeverity::Critical: return "critical";
        default: return "high";
    }
}

}  // namespace align
