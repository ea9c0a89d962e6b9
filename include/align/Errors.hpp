#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace align {

enum class ErrorCategory {
    InputValidation,
    DimensionMismatch,
    FileAccess,
    DataFormat,
    Configuration,
    Collaborator,
    Unexpected
};

enum class ErrorSeverity {
    Low,       // run continues with minor degradation
    Medium,    // feature unavailable
    High,      // current operation failed
    Critical
};

struct ErrorInfo {
    ErrorCategory category = ErrorCategory::Unexpected;
    ErrorSeverity severity = ErrorSeverity::High;
    std::string code;              // stable machine key, e.g. "empty_reference"
    std::string message;
    std::string details;
    std::string suggested_action;
};

const char* category_str(ErrorCategory c);
const char* severity_str(ErrorSeverity s);

// Either a value or a structured failure. Engine entry points return this
// instead of throwing on bad input.
template <typename T>
struct Outcome {
    bool ok = false;
    T value{};
    ErrorInfo error;

    static Outcome success(T v) {
        Outcome o;
        o.ok = true;
        o.value = std::move(v);
        return o;
    }

    static Outcome failure(ErrorInfo e) {
        Outcome o;
        o.ok = false;
        o.error = std::move(e);
        return o;
    }
};

// Two embeddings of different length reached the similarity function.
// Points at the embedding provider, not at the caller.
class DimensionMismatch : public std::runtime_error {
public:
    DimensionMismatch(size_t lhs, size_t rhs);

    size_t lhs_size() const { return m_lhs; }
    size_t rhs_size() const { return m_rhs; }

private:
    size_t m_lhs = 0;
    size_t m_rhs = 0;
};

}  // namespace align
