#pragma once

#include "diagnostics.h"
#include "line_items.h"
#include "matcher.h"
#include "options.h"
#include "period_detector.h"
#include "sheet_classifier.h"
#include "variance_engine.h"
#include "workbook.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Results
// ============================================================================

// Periods and line items of one sheet
struct SheetStructure {
    bool success = false;
    ModelSide side = ModelSide::None;
    StatementType statementType = StatementType::IncomeStatement;
    std::string sheet;
    PeriodDetectionResult periods;
    ExtractionResult extraction;
    std::vector<PeriodTemplate> templateSuggestions;  // Derived from the detected labels
    std::vector<Finding> findings;  // Detection + extraction findings
};

struct StatementAnalysis {
    bool success = false;
    StatementType statementType = StatementType::IncomeStatement;
    SheetStructure oldStructure;
    SheetStructure newStructure;
    MatchResult match;
    PeriodAlignment alignment;
    std::string period;                        // Selected label
    std::optional<std::string> oldPeriodLabel; // Resolved per side
    std::optional<std::string> newPeriodLabel;
    std::vector<VarianceResult> variances;     // Same order as match.pairs
    std::vector<Finding> findings;             // Everything for this statement

    const MatchedPair* findPair(const std::string& lineItemName) const;
};

// Compatibility of the two models as a whole
struct ConsistencyCheck {
    bool structureMatch = false;           // Every statement parsed on both sides or on neither
    double namingConsistency = 1.0;        // Shared labels over all distinct labels
    bool periodAlignmentPossible = false;  // Some statement has a period common to both models
    double compatibilityScore = 0.0;       // 0.4 structure + 0.3 naming + 0.3 periods
    std::vector<std::string> issues;
    std::vector<std::string> warnings;
};

ConsistencyCheck checkConsistency(const std::vector<StatementAnalysis>& statements);

struct PipelineTiming {
    double detect_time_ms = 0.0;
    double match_time_ms = 0.0;
    double variance_time_ms = 0.0;
    double total_time_ms = 0.0;
};

struct AnalysisReport {
    bool success = false;             // At least one statement analysed
    std::string period;
    std::vector<StatementAnalysis> statements;  // In StatementType order
    std::vector<Finding> findings;    // Request-level findings
    ConsistencyCheck consistency;
    PipelineTiming timing;

    const StatementAnalysis* statement(StatementType type) const;
};

// ============================================================================
// Variance Analyzer
// ============================================================================

/**
 * @brief Pipeline facade: detection, matching, variance and drill-down.
 *
 * Workbooks are shared read-only. No exception escapes the public methods;
 * internal failures are reported as findings.
 */
class VarianceAnalyzer {
public:
    VarianceAnalyzer(std::shared_ptr<const WorkbookModel> oldWorkbook,
                     std::shared_ptr<const WorkbookModel> newWorkbook,
                     const EngineOptions& options = EngineOptions());

    void setPeriodTemplates(const std::vector<PeriodTemplate>& templates) { templates_ = templates; }
    const std::vector<PeriodTemplate>& periodTemplates() const { return templates_; }

    // Structure probe for one sheet of one side
    SheetStructure probeSheet(ModelSide side, const std::string& sheetName,
                              StatementType type) const;

    // Run the pipeline for the selected sheets and period. The selection
    // names the same sheet in both workbooks.
    AnalysisReport analyze(const SheetSelection& selection, const std::string& period) const;

    // Same, with a distinct sheet name per side
    AnalysisReport analyze(const SheetSelection& oldSelection, const SheetSelection& newSelection,
                           const std::string& period) const;

    // Drill down one line item of an analysed statement
    DrillDownResult drillDown(const StatementAnalysis& statement,
                              const std::string& lineItemName) const;

    const WorkbookModel& oldWorkbook() const { return *oldWorkbook_; }
    const WorkbookModel& newWorkbook() const { return *newWorkbook_; }
    const EngineOptions& options() const { return options_; }

private:
    std::shared_ptr<const WorkbookModel> oldWorkbook_;
    std::shared_ptr<const WorkbookModel> newWorkbook_;
    EngineOptions options_;
    std::vector<PeriodTemplate> templates_;

    StatementAnalysis matchStatement(StatementType type, SheetStructure oldStructure,
                                     SheetStructure newStructure, const std::string& period) const;
    void measureStatement(StatementAnalysis& statement) const;
};

}  // namespace finvar
