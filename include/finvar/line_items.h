#pragma once

#include "diagnostics.h"
#include "options.h"
#include "period_detector.h"
#include "workbook.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Statement Type
// ============================================================================

enum class StatementType {
    IncomeStatement,
    BalanceSheet,
    CashFlow
};

std::string statementTypeToString(StatementType type);

// Accepts "income_statement", "IS", "income", "balance_sheet", "BS",
// "cash_flow", "CF" (case-insensitive)
std::optional<StatementType> parseStatementType(const std::string& text);

// ============================================================================
// Line Item
// ============================================================================

struct LineItem {
    std::string name;              // Verbatim label text
    std::string sheet;
    int row = 0;
    int labelColumn = 0;
    StatementType statementType = StatementType::IncomeStatement;
    std::map<std::string, std::optional<double>> values;  // period label -> value
    std::optional<std::string> formula;                    // First formula on the row
    std::map<std::string, std::string> periodFormulas;     // period label -> formula text

    std::optional<double> value(const std::string& periodLabel) const;
    bool hasFormula() const { return formula.has_value(); }
    bool hasFormula(const std::string& periodLabel) const { return periodFormulas.count(periodLabel) > 0; }
};

// Non-empty and not made purely of punctuation/whitespace
bool isMeaningfulLabel(const std::string& text);

// ============================================================================
// Extraction
// ============================================================================

struct ExtractionResult {
    std::vector<LineItem> items;
    int lastScannedRow = 0;
    int stopRow = 0;               // Row where the empty-row rule fired (0 = end of sheet)
    int sectionHeaderCount = 0;    // Label-only rows skipped
    std::vector<Finding> findings;
};

class LineItemExtractor {
public:
    explicit LineItemExtractor(const EngineOptions& options = EngineOptions());

    ExtractionResult extract(const Sheet& sheet,
                             const PeriodDetectionResult& periods,
                             StatementType type) const;

private:
    EngineOptions options_;

    std::optional<std::pair<int, std::string>> findLabel(const Sheet& sheet, int row,
                                                         int firstPeriodColumn) const;
};

}  // namespace finvar
