#include <catch2/catch_test_macros.hpp>
#include "finvar/line_items.h"

namespace {

finvar::Sheet makeHeader(const std::string& name) {
    finvar::Sheet sheet(name);
    sheet.setValue(1, 2, std::string("FY2023"));
    sheet.setValue(1, 3, std::string("FY2024"));
    sheet.setValue(1, 4, std::string("FY2025"));
    return sheet;
}

void addRow(finvar::Sheet& sheet, int row, const std::string& label, double a, double b, double c) {
    sheet.setValue(row, 1, label);
    sheet.setValue(row, 2, a);
    sheet.setValue(row, 3, b);
    sheet.setValue(row, 4, c);
}

}  // namespace

TEST_CASE("Statement type names", "[extract]") {
    REQUIRE(finvar::statementTypeToString(finvar::StatementType::IncomeStatement) == "income_statement");
    REQUIRE(finvar::statementTypeToString(finvar::StatementType::CashFlow) == "cash_flow");
    REQUIRE(finvar::parseStatementType("IS") == finvar::StatementType::IncomeStatement);
    REQUIRE(finvar::parseStatementType("Balance Sheet") == finvar::StatementType::BalanceSheet);
    REQUIRE(finvar::parseStatementType("cash-flow") == finvar::StatementType::CashFlow);
    REQUIRE_FALSE(finvar::parseStatementType("notes"));
}

TEST_CASE("Meaningful labels", "[extract]") {
    REQUIRE(finvar::isMeaningfulLabel("Revenue"));
    REQUIRE(finvar::isMeaningfulLabel("  EBITDA  "));
    REQUIRE(finvar::isMeaningfulLabel("Ventas netas \xC3\xA9"));
    REQUIRE_FALSE(finvar::isMeaningfulLabel(""));
    REQUIRE_FALSE(finvar::isMeaningfulLabel("   "));
    REQUIRE_FALSE(finvar::isMeaningfulLabel("----"));
}

TEST_CASE("Line item extraction", "[extract]") {
    finvar::PeriodDetector detector;
    finvar::LineItemExtractor extractor;

    SECTION("Rows with a label and a number become line items") {
        auto sheet = makeHeader("IS");
        addRow(sheet, 2, "Revenue", 100, 120, 130);
        addRow(sheet, 3, "COGS", 40, 50, 55);
        sheet.setValue(4, 1, std::string("Gross Profit"));
        sheet.setFormula(4, 2, "=B2-B3", 60.0);
        sheet.setFormula(4, 3, "=C2-C3", 70.0);
        sheet.setValue(4, 4, 75.0);

        auto periods = detector.detect(sheet);
        REQUIRE(periods.success);
        auto result = extractor.extract(sheet, periods, finvar::StatementType::IncomeStatement);

        REQUIRE(result.items.size() == 3);
        REQUIRE(result.items[0].name == "Revenue");
        REQUIRE(result.items[0].row == 2);
        REQUIRE(result.items[0].value("FY2024") == 120.0);
        REQUIRE_FALSE(result.items[0].hasFormula());

        const auto& gross = result.items[2];
        REQUIRE(gross.hasFormula());
        REQUIRE(*gross.formula == "=B2-B3");
        REQUIRE(gross.hasFormula("FY2024"));
        REQUIRE_FALSE(gross.hasFormula("FY2025"));
        REQUIRE(gross.value("FY2025") == 75.0);
        REQUIRE_FALSE(gross.value("FY2030"));
        REQUIRE(result.stopRow == 0);
        REQUIRE(result.findings.empty());
    }

    SECTION("Label text is kept verbatim") {
        auto sheet = makeHeader("IS");
        addRow(sheet, 2, "  Net Income (loss) ", 1, 2, 3);
        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.size() == 1);
        REQUIRE(result.items[0].name == "  Net Income (loss) ");
    }

    SECTION("Section headers are skipped without ending the scan") {
        auto sheet = makeHeader("IS");
        sheet.setValue(2, 1, std::string("Operating expenses"));
        addRow(sheet, 3, "Salaries", 10, 11, 12);
        sheet.setValue(4, 1, std::string("Other"));
        addRow(sheet, 5, "Rent", 5, 5, 6);

        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.size() == 2);
        REQUIRE(result.items[1].name == "Rent");
        REQUIRE(result.sectionHeaderCount == 2);
    }

    SECTION("Ten consecutive empty rows stop the scan") {
        auto sheet = makeHeader("IS");
        addRow(sheet, 2, "Revenue", 100, 120, 130);
        // Rows 3..12 empty, row 13 is past the stop
        addRow(sheet, 13, "Memo: headcount", 10, 12, 14);

        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.size() == 1);
        REQUIRE(result.stopRow == 12);
    }

    SECTION("Nine empty rows do not stop the scan") {
        auto sheet = makeHeader("IS");
        addRow(sheet, 2, "Revenue", 100, 120, 130);
        addRow(sheet, 12, "Net Income", 10, 12, 14);

        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.size() == 2);
        REQUIRE(result.items[1].row == 12);
        REQUIRE(result.stopRow == 0);
    }

    SECTION("Numeric-only rows are neither items nor empty") {
        auto sheet = makeHeader("IS");
        addRow(sheet, 2, "Revenue", 100, 120, 130);
        sheet.setValue(3, 2, 1.0);
        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.size() == 1);
        REQUIRE(result.sectionHeaderCount == 0);
    }

    SECTION("Non-numeric period values are reported") {
        auto sheet = makeHeader("IS");
        addRow(sheet, 2, "Revenue", 100, 120, 130);
        sheet.setValue(2, 4, std::string("n/a"));
        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.size() == 1);
        REQUIRE_FALSE(result.items[0].value("FY2025"));
        REQUIRE(result.findings.size() == 1);
        REQUIRE(result.findings[0].code == "NonNumericValue");
        REQUIRE(result.findings[0].category == finvar::ErrorCategory::DataError);
        REQUIRE(result.findings[0].location.toString() == "IS!D2");
    }

    SECTION("Periods in the first column leave no room for labels") {
        finvar::Sheet sheet("IS");
        sheet.setValue(1, 1, std::string("FY2023"));
        sheet.setValue(1, 2, std::string("FY2024"));
        sheet.setValue(1, 3, std::string("FY2025"));
        sheet.setValue(2, 1, 1.0);
        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.empty());
        REQUIRE(result.findings.size() == 1);
        REQUIRE(result.findings[0].code == "NoLabelColumn");
    }

    SECTION("No periods, no items") {
        finvar::Sheet sheet("IS");
        addRow(sheet, 2, "Revenue", 100, 120, 130);
        auto result = extractor.extract(sheet, detector.detect(sheet), finvar::StatementType::IncomeStatement);
        REQUIRE(result.items.empty());
    }
}
