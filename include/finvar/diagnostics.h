#pragma once

#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Error Taxonomy
// ============================================================================

/**
 * @brief High-level categories for everything the engine reports.
 */
enum class ErrorCategory {
    StructuralError,  // No period header, missing sheet
    MatchingWarning,  // Line item present on one side only
    FormulaError,     // Unparseable formula, dangling reference
    GraphError,       // Circular reference, depth or timeout bound hit
    DataError         // Non-numeric value where a number was expected
};

enum class Severity {
    Info,
    Warning,
    Fatal
};

std::string categoryToString(ErrorCategory category);
std::string severityToString(Severity severity);

// ============================================================================
// Source Location
// ============================================================================

enum class ModelSide {
    None,
    Old,
    New
};

std::string sideToString(ModelSide side);

// Where in the workbook a finding originated. Row/col are 1-based, 0 = unknown.
struct SourceLocation {
    ModelSide side = ModelSide::None;
    std::string sheet;
    int row = 0;
    int col = 0;

    bool empty() const { return sheet.empty() && row == 0 && col == 0; }

    // "IS!C14", "IS!14" (row only), "IS"
    std::string toString() const;
};

// ============================================================================
// Finding
// ============================================================================

struct Finding {
    ErrorCategory category = ErrorCategory::DataError;
    Severity severity = Severity::Warning;
    std::string code;      // Stable identifier, e.g. "NoPeriodHeaderFound"
    std::string message;   // Human-readable reason
    SourceLocation location;

    bool isFatal() const { return severity == Severity::Fatal; }

    // "[old] GraphError CircularReferenceDetected at IS!C14: ..."
    std::string toString() const;
};

inline Finding makeFinding(ErrorCategory category, Severity severity,
                           const std::string& code, const std::string& message,
                           SourceLocation location = SourceLocation()) {
    Finding f;
    f.category = category;
    f.severity = severity;
    f.code = code;
    f.message = message;
    f.location = std::move(location);
    return f;
}

// Count findings of a given category
size_t countFindings(const std::vector<Finding>& findings, ErrorCategory category);

// True if any finding is fatal
bool hasFatal(const std::vector<Finding>& findings);

}  // namespace finvar
