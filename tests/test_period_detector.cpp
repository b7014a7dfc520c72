#include <catch2/catch_test_macros.hpp>
#include "finvar/period_detector.h"

namespace {

// Title row, blank row, then the period header on row 3
finvar::Sheet makeIncomeSheet() {
    finvar::Sheet sheet("IS");
    sheet.setValue(1, 1, std::string("Acme Corp - Income Statement"));
    sheet.setValue(3, 1, std::string("USD thousands"));
    sheet.setValue(3, 2, std::string("FY2023"));
    sheet.setValue(3, 3, std::string("FY2024"));
    sheet.setValue(3, 4, std::string("FY2025E"));
    sheet.setValue(4, 1, std::string("Revenue"));
    sheet.setValue(4, 2, 100.0);
    sheet.setValue(4, 3, 120.0);
    sheet.setValue(4, 4, 130.0);
    return sheet;
}

}  // namespace

TEST_CASE("Period token recognition", "[period]") {
    finvar::PeriodDetector detector;

    SECTION("Quarters") {
        REQUIRE(detector.isPeriodToken("Q1 2024"));
        REQUIRE(detector.isPeriodToken("Q3'24"));
        REQUIRE(detector.isPeriodToken("1Q24"));
        REQUIRE(detector.isPeriodToken("2Q2025E"));
        REQUIRE(detector.isPeriodToken("FY1Q25"));
        REQUIRE(detector.isPeriodToken("2024 Q4"));
        REQUIRE_FALSE(detector.isPeriodToken("Q5 2024"));
    }

    SECTION("Years") {
        REQUIRE(detector.isPeriodToken("2024"));
        REQUIRE(detector.isPeriodToken("2024E"));
        REQUIRE(detector.isPeriodToken("FY2024"));
        REQUIRE(detector.isPeriodToken("FY 24"));
        REQUIRE(detector.isPeriodToken("CY2023"));
        REQUIRE(detector.isPeriodToken("2023 Actual"));
        REQUIRE(detector.isPeriodToken("  FY2024  "));
    }

    SECTION("Months and halves") {
        REQUIRE(detector.isPeriodToken("Mar 2024"));
        REQUIRE(detector.isPeriodToken("Mar-24"));
        REQUIRE(detector.isPeriodToken("September 2023"));
        REQUIRE(detector.isPeriodToken("3/2024"));
        REQUIRE(detector.isPeriodToken("H1 2024"));
        REQUIRE(detector.isPeriodToken("2H24"));
    }

    SECTION("Out-of-range years and non-periods") {
        REQUIRE_FALSE(detector.isPeriodToken("1850"));
        REQUIRE_FALSE(detector.isPeriodToken("2099"));
        REQUIRE_FALSE(detector.isPeriodToken("Revenue"));
        REQUIRE_FALSE(detector.isPeriodToken("Total"));
        REQUIRE_FALSE(detector.isPeriodToken(""));
        REQUIRE_FALSE(detector.isPeriodToken("555-123-4567"));
        REQUIRE_FALSE(detector.isPeriodToken("2024551234"));
        REQUIRE_FALSE(detector.isPeriodToken("Phone 2024"));
    }
}

TEST_CASE("Period labels keep the cell text", "[period]") {
    finvar::PeriodDetector detector;
    finvar::Sheet sheet("IS");

    auto& text = sheet.setValue(1, 1, std::string(" FY2024 "));
    REQUIRE(detector.periodLabel(text) == std::optional<std::string>(" FY2024 "));

    auto& number = sheet.setValue(1, 2, 2024.0);
    REQUIRE(detector.periodLabel(number) == std::optional<std::string>("2024"));

    auto& fraction = sheet.setValue(1, 3, 2024.5);
    REQUIRE_FALSE(detector.periodLabel(fraction));

    finvar::EngineOptions options;
    options.numericYearHeaders = false;
    finvar::PeriodDetector textOnly(options);
    REQUIRE_FALSE(textOnly.periodLabel(number));
}

TEST_CASE("Header row detection", "[period]") {
    finvar::PeriodDetector detector;

    SECTION("Periods in left-to-right column order") {
        auto sheet = makeIncomeSheet();
        auto result = detector.detect(sheet);
        REQUIRE(result.success);
        REQUIRE(result.headerRow == 3);
        REQUIRE(result.matchCount == 3);
        REQUIRE(result.periods.size() == 3);
        REQUIRE(result.periods[0].label == "FY2023");
        REQUIRE(result.periods[0].columnIndex == 2);
        REQUIRE(result.periods[2].label == "FY2025E");
        REQUIRE(result.periods[2].columnIndex == 4);
        REQUIRE(result.find("FY2024") == &result.periods[1]);
        REQUIRE(result.find("FY2026") == nullptr);
        REQUIRE(result.findings.empty());
    }

    SECTION("Numeric year headers") {
        finvar::Sheet sheet("BS");
        sheet.setValue(2, 2, 2022.0);
        sheet.setValue(2, 3, 2023.0);
        sheet.setValue(2, 4, 2024.0);
        auto result = detector.detect(sheet);
        REQUIRE(result.success);
        REQUIRE(result.headerRow == 2);
        REQUIRE(result.periods[1].label == "2023");
    }

    SECTION("Earliest row wins a tie") {
        finvar::Sheet sheet("IS");
        for (int col = 2; col <= 4; ++col) {
            sheet.setValue(2, col, std::string("Q" + std::to_string(col - 1) + " 2024"));
            sheet.setValue(5, col, std::string("Q" + std::to_string(col - 1) + " 2023"));
        }
        auto result = detector.detect(sheet);
        REQUIRE(result.success);
        REQUIRE(result.headerRow == 2);
    }

    SECTION("Rows with fewer than the minimum matches do not qualify") {
        finvar::Sheet sheet("IS");
        sheet.setValue(1, 2, std::string("FY2023"));
        sheet.setValue(1, 3, std::string("FY2024"));
        auto result = detector.detect(sheet);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.headerRow == 0);
        REQUIRE(finvar::hasFatal(result.findings));
        REQUIRE(result.findings.back().code == "NoPeriodHeaderFound");
        REQUIRE(result.findings.back().category == finvar::ErrorCategory::StructuralError);
    }

    SECTION("Headers below the scan window are ignored") {
        finvar::Sheet sheet("IS");
        for (int col = 2; col <= 4; ++col) {
            sheet.setValue(12, col, std::string("FY202" + std::to_string(col)));
        }
        REQUIRE_FALSE(detector.detect(sheet).success);

        finvar::EngineOptions options;
        options.headerScanRows = 15;
        finvar::PeriodDetector deeper(options);
        auto result = deeper.detect(sheet);
        REQUIRE(result.success);
        REQUIRE(result.headerRow == 12);
    }

    SECTION("Duplicate labels are reported") {
        finvar::Sheet sheet("IS");
        sheet.setValue(1, 2, std::string("FY2023"));
        sheet.setValue(1, 3, std::string("FY2024"));
        sheet.setValue(1, 4, std::string("FY2024"));
        auto result = detector.detect(sheet);
        REQUIRE(result.success);
        REQUIRE(result.periods.size() == 3);
        REQUIRE(result.find("FY2024")->columnIndex == 3);
        REQUIRE(finvar::countFindings(result.findings, finvar::ErrorCategory::StructuralError) == 1);
        REQUIRE(result.findings[0].code == "DuplicatePeriodLabel");
    }
}

TEST_CASE("Period templates", "[period]") {
    SECTION("Template to regex") {
        REQUIRE(finvar::templateToRegex("FY{YYYY}") == R"(FY\d{4})");
        REQUIRE(finvar::templateToRegex("{Q}Q{YY}[E]") == R"([1-4]Q\d{2}(?:E)?)");
        REQUIRE(finvar::templateToRegex("re:P\\d+") == "P\\d+");
        REQUIRE_THROWS_AS(finvar::templateToRegex("{XYZ}"), std::invalid_argument);
        REQUIRE_THROWS_AS(finvar::templateToRegex("FY{YYYY"), std::invalid_argument);
    }

    SECTION("Templates extend the token set") {
        finvar::PeriodDetector detector;
        REQUIRE_FALSE(detector.isPeriodToken("P01-2024"));
        detector.addTemplates({{"Period format", "P{MM}-{YYYY}", "P01-2024", "monthly"}});
        REQUIRE(detector.isPeriodToken("P01-2024"));
        REQUIRE(detector.isPeriodToken("p12-2023"));
    }

    SECTION("Invalid templates become findings") {
        finvar::PeriodDetector detector;
        detector.addTemplates({{"Broken", "re:([", "", "annual"},
                               {"Unknown", "{DAY}", "", "daily"}});
        auto sheet = makeIncomeSheet();
        auto result = detector.detect(sheet);
        REQUIRE(result.success);
        REQUIRE(result.findings.size() == 2);
        REQUIRE(result.findings[0].code == "InvalidPeriodTemplate");
        REQUIRE(result.findings[1].code == "InvalidPeriodTemplate");
    }

    SECTION("Suggestions from sample labels") {
        auto suggested = finvar::suggestTemplatesFromSamples({"FY2023", "FY2024E", "1Q24", "2Q24", "Total"});
        REQUIRE(suggested.size() == 3);
        REQUIRE(suggested[0].pattern == "FY{YYYY}");
        REQUIRE(suggested[0].type == "annual");
        REQUIRE(suggested[1].pattern == "FY{YYYY}[E]");
        REQUIRE(suggested[2].pattern == "{Q}Q{YY}");
        REQUIRE(suggested[2].type == "quarterly");
        REQUIRE(suggested[2].example == "1Q24");
    }

    SECTION("Load from JSON") {
        std::string error;
        auto loaded = finvar::loadPeriodTemplatesJSON(
            R"([{"name": "Fiscal", "pattern": "FY{YY}", "type": "annual"}])", error);
        REQUIRE(loaded);
        REQUIRE(loaded->size() == 1);
        REQUIRE((*loaded)[0].pattern == "FY{YY}");

        auto wrapped = finvar::loadPeriodTemplatesJSON(R"({"templates": [{"pattern": "{YYYY}"}]})", error);
        REQUIRE(wrapped);
        REQUIRE((*wrapped)[0].name == "{YYYY}");

        REQUIRE_FALSE(finvar::loadPeriodTemplatesJSON(R"({"pattern": "x"})", error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(finvar::loadPeriodTemplatesJSON(R"([{"name": "no pattern"}])", error));
    }
}
