#pragma once

#include "analyzer.h"
#include "diagnostics.h"
#include "formula_parser.h"
#include "sheet_classifier.h"
#include "variance_engine.h"
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// JSON Output
// ============================================================================

// Structure probe: {"sheet", "header_row", "periods": [...], "line_items": [...]}
std::string generateStructureJSON(const SheetStructure& structure);

// Variance report for every analysed statement. Timings are left out unless
// requested so that repeated runs produce identical output.
std::string generateVarianceJSON(const AnalysisReport& report, bool includeTiming = false);

std::string generateDrillDownJSON(const DrillDownResult& result);

std::string generateSelectionJSON(const SheetSelection& selection);

std::string generateComplexityJSON(const FormulaComplexityInfo& info);

// ============================================================================
// Text Output
// ============================================================================

// Fixed-width variance table per statement
std::string generateVarianceTable(const AnalysisReport& report);

std::string generateDrillDownTable(const DrillDownResult& result);

// One line per finding
std::string formatFindings(const std::vector<Finding>& findings);

// Number rendering used by every text report ("1,234.50", "-", "n/a")
std::string formatAmount(const std::optional<double>& value);

}  // namespace finvar
