#pragma once

#include <string>

namespace finvar {

// ============================================================================
// Engine Options
// ============================================================================

/**
 * @brief Tunables for detection, matching and drill-down.
 *
 * Defaults reproduce the documented heuristics. Every field can be overridden
 * from a finvar.conf file (see loadEngineOptionsFromFile).
 */
struct EngineOptions {
    // Period detection
    int headerScanRows = 10;          // Rows scanned for the period header (K)
    int minPeriodMatches = 3;         // Matching cells needed for a row to qualify
    bool numericYearHeaders = true;   // Integral numeric cells in year range count as periods
    int yearMin = 1990;               // Plausible range for bare 4-digit years
    int yearMax = 2050;

    // Line item extraction
    int maxConsecutiveEmptyRows = 10; // Universal stopping rule
    int labelScanColumns = 5;         // Columns searched for the row label

    // Matching
    double fuzzyThreshold = 0.80;     // Minimum similarity for a fuzzy pair

    // Dependency graph / drill-down
    int maxGraphDepth = 64;           // Nodes deeper than this are truncated leaves
    int maxGraphNodes = 20000;        // Hard cap on nodes per graph
    int maxRangeCells = 10000;        // Cap on cells expanded from one range
    int drillDownTimeoutMs = 5000;    // Wall-clock bound per drill-down (0 = none)
    bool failOnDepthExceeded = false; // Treat truncation as Failed(DepthExceeded)

    // Variance
    double varianceThreshold = 0.01;  // |pct| >= 1% is significant

    // Execution
    int threads = 0;                  // Worker pool size (0 = hardware concurrency)
    bool verbose = false;             // Diagnostic output on stderr
};

/**
 * @brief Load options from a key = value file ('#' starts a comment).
 *
 * Unknown keys are reported on stderr and skipped.
 * @return false if the file cannot be opened.
 */
bool loadEngineOptionsFromFile(const std::string& path, EngineOptions& options);

}  // namespace finvar
