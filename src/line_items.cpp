#include "finvar/line_items.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

namespace finvar {

// ============================================================================
// Statement Type
// ============================================================================

std::string statementTypeToString(StatementType type) {
    switch (type) {
        case StatementType::IncomeStatement: return "income_statement";
        case StatementType::BalanceSheet: return "balance_sheet";
        case StatementType::CashFlow: return "cash_flow";
        default: return "unknown";
    }
}

std::optional<StatementType> parseStatementType(const std::string& text) {
    std::string t;
    for (char c : text) {
        if (c == '-' || c == ' ') c = '_';
        t += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (t == "income_statement" || t == "is" || t == "income" || t == "pnl" || t == "p&l") {
        return StatementType::IncomeStatement;
    }
    if (t == "balance_sheet" || t == "bs" || t == "balance") {
        return StatementType::BalanceSheet;
    }
    if (t == "cash_flow" || t == "cf" || t == "cashflow" || t == "cash") {
        return StatementType::CashFlow;
    }
    return std::nullopt;
}

// ============================================================================
// Line Item
// ============================================================================

std::optional<double> LineItem::value(const std::string& periodLabel) const {
    auto it = values.find(periodLabel);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

bool isMeaningfulLabel(const std::string& text) {
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isalnum(c) || c >= 0x80; });
}

// ============================================================================
// Extraction
// ============================================================================

LineItemExtractor::LineItemExtractor(const EngineOptions& options) : options_(options) {}

std::optional<std::pair<int, std::string>> LineItemExtractor::findLabel(
    const Sheet& sheet, int row, int firstPeriodColumn) const {
    int lastColumn = std::min(options_.labelScanColumns, firstPeriodColumn - 1);
    for (int col = 1; col <= lastColumn; ++col) {
        const Cell* c = sheet.cell(row, col);
        if (!c) continue;
        if (const auto* s = std::get_if<std::string>(&c->rawValue)) {
            if (isMeaningfulLabel(*s)) return std::make_pair(col, *s);
        }
    }
    return std::nullopt;
}

ExtractionResult LineItemExtractor::extract(const Sheet& sheet,
                                            const PeriodDetectionResult& periods,
                                            StatementType type) const {
    ExtractionResult result;
    if (!periods.success || periods.periods.empty()) {
        return result;
    }

    int firstPeriodColumn = periods.periods.front().columnIndex;
    for (const auto& p : periods.periods) {
        firstPeriodColumn = std::min(firstPeriodColumn, p.columnIndex);
    }
    if (firstPeriodColumn <= 1) {
        SourceLocation loc;
        loc.sheet = sheet.name();
        loc.row = periods.headerRow;
        result.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Warning,
            "NoLabelColumn", "Periods start in the first column; there is no column for line item labels", loc));
        return result;
    }

    // Duplicate labels read from their first column only
    std::vector<const Period*> columns;
    std::set<std::string> seen;
    for (const auto& p : periods.periods) {
        if (seen.insert(p.label).second) columns.push_back(&p);
    }

    int consecutiveEmptyRows = 0;
    for (int row = periods.headerRow + 1; row <= sheet.maxRow(); ++row) {
        result.lastScannedRow = row;

        auto label = findLabel(sheet, row, firstPeriodColumn);

        bool hasNumeric = false;
        for (const Period* p : columns) {
            const Cell* c = sheet.cell(row, p->columnIndex);
            if (c && c->numericValue()) {
                hasNumeric = true;
                break;
            }
        }

        if (!label && !hasNumeric) {
            if (++consecutiveEmptyRows >= options_.maxConsecutiveEmptyRows) {
                result.stopRow = row;
                break;
            }
            continue;
        }
        if (!label) {
            // Numeric-only rows are neither empty nor line items
            continue;
        }
        if (!hasNumeric) {
            ++result.sectionHeaderCount;
            continue;
        }

        consecutiveEmptyRows = 0;

        LineItem item;
        item.name = label->second;
        item.sheet = sheet.name();
        item.row = row;
        item.labelColumn = label->first;
        item.statementType = type;

        for (const Period* p : columns) {
            const Cell* c = sheet.cell(row, p->columnIndex);
            if (!c) {
                item.values[p->label] = std::nullopt;
                continue;
            }
            if (c->hasFormula()) {
                if (!item.formula) item.formula = *c->formula;
                item.periodFormulas[p->label] = *c->formula;
            }
            auto number = c->numericValue();
            item.values[p->label] = number;
            if (!number && !isEmptyValue(c->rawValue)) {
                SourceLocation loc;
                loc.sheet = sheet.name();
                loc.row = row;
                loc.col = p->columnIndex;
                result.findings.push_back(makeFinding(ErrorCategory::DataError, Severity::Warning,
                    "NonNumericValue",
                    "'" + item.name + "' has non-numeric value '" + valueToString(c->rawValue) +
                    "' for period '" + p->label + "'",
                    loc));
            }
        }

        result.items.push_back(std::move(item));
    }

    if (options_.verbose) {
        std::cerr << "[extract] " << sheet.name() << ": " << result.items.size() << " line items, "
                  << result.sectionHeaderCount << " section headers, stopped at row "
                  << (result.stopRow ? std::to_string(result.stopRow) : std::string("end")) << "\n";
    }
    return result;
}

}  // namespace finvar
