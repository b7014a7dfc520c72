#include "finvar/diagnostics.h"
#include "finvar/workbook.h"
#include <algorithm>
#include <sstream>

namespace finvar {

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::StructuralError: return "StructuralError";
        case ErrorCategory::MatchingWarning: return "MatchingWarning";
        case ErrorCategory::FormulaError: return "FormulaError";
        case ErrorCategory::GraphError: return "GraphError";
        case ErrorCategory::DataError: return "DataError";
        default: return "Unknown";
    }
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Fatal: return "fatal";
        default: return "unknown";
    }
}

std::string sideToString(ModelSide side) {
    switch (side) {
        case ModelSide::None: return "";
        case ModelSide::Old: return "old";
        case ModelSide::New: return "new";
        default: return "";
    }
}

std::string SourceLocation::toString() const {
    std::string out = sheet;
    if (row > 0 && col > 0) {
        if (!out.empty()) out += "!";
        out += cellAddress(row, col);
    } else if (row > 0) {
        if (!out.empty()) out += "!";
        out += std::to_string(row);
    }
    return out;
}

std::string Finding::toString() const {
    std::ostringstream ss;
    if (location.side != ModelSide::None) {
        ss << "[" << sideToString(location.side) << "] ";
    }
    ss << categoryToString(category) << " " << code;
    if (!location.empty()) {
        ss << " at " << location.toString();
    }
    ss << ": " << message;
    return ss.str();
}

size_t countFindings(const std::vector<Finding>& findings, ErrorCategory category) {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
        [category](const Finding& f) { return f.category == category; }));
}

bool hasFatal(const std::vector<Finding>& findings) {
    return std::any_of(findings.begin(), findings.end(),
                       [](const Finding& f) { return f.isFatal(); });
}

}  // namespace finvar
