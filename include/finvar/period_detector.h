#pragma once

#include "diagnostics.h"
#include "options.h"
#include "workbook.h"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Period
// ============================================================================

struct Period {
    std::string label;     // Verbatim header text
    int columnIndex = 0;   // 1-based column
    std::string sheet;
    int headerRow = 0;     // 1-based row
};

// ============================================================================
// Period Templates
// ============================================================================

/**
 * @brief User-provided extension of the period token set.
 *
 * Pattern syntax: placeholders {YYYY} {YY} {Q} {H} {M} {MM} {MMM} {WW},
 * "[E]" marks an optional literal, anything else is literal text.
 * A pattern starting with "re:" is used as a raw ECMAScript regex.
 */
struct PeriodTemplate {
    std::string name;
    std::string pattern;
    std::string example;
    std::string type;  // "annual", "quarterly", "monthly", "half", "weekly"

    bool operator==(const PeriodTemplate& other) const {
        return pattern == other.pattern && type == other.type;
    }
};

// Regex alternation of full and abbreviated English month names
const std::string& monthNamePattern();

// Translate a template pattern into a regex source string.
// Throws std::invalid_argument for an unknown placeholder.
std::string templateToRegex(const std::string& pattern);

// Derive templates from labels found by the default heuristic
std::vector<PeriodTemplate> suggestTemplatesFromSamples(const std::vector<std::string>& labels);

// Load templates from a JSON array of {"name", "pattern", "type", "example"}
// objects. Returns nullopt and sets errorMessage on malformed input.
std::optional<std::vector<PeriodTemplate>> loadPeriodTemplatesJSON(const std::string& jsonText,
                                                                   std::string& errorMessage);

// ============================================================================
// Detection Result
// ============================================================================

struct PeriodDetectionResult {
    bool success = false;
    int headerRow = 0;              // 0 when no row qualified
    int matchCount = 0;
    std::vector<Period> periods;    // Strict left-to-right column order
    std::vector<int> rowScores;     // Matches per scanned row (index 0 = row 1)
    std::vector<Finding> findings;

    const Period* find(const std::string& label) const;
};

// ============================================================================
// Period Detector
// ============================================================================

class PeriodDetector {
public:
    explicit PeriodDetector(const EngineOptions& options = EngineOptions());

    // Extend the token set. Invalid templates are skipped and reported
    // as findings by the next detect() call.
    void addTemplates(const std::vector<PeriodTemplate>& templates);

    // Find the period header row and its ordered periods
    PeriodDetectionResult detect(const Sheet& sheet) const;

    // True if the text looks like a period label
    bool isPeriodToken(const std::string& text) const;

    // Period label for a cell, if the cell holds a period token
    std::optional<std::string> periodLabel(const Cell& cell) const;

private:
    struct TokenPattern {
        std::string name;
        std::regex regex;
        bool checkYearRange = false;
    };

    EngineOptions options_;
    std::vector<TokenPattern> patterns_;
    std::vector<TokenPattern> templatePatterns_;
    std::vector<Finding> templateFindings_;

    void initializeDefaultPatterns();
    bool inYearRange(const std::string& text) const;
};

}  // namespace finvar
