#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "finvar/workbook.h"

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Cell address helpers", "[workbook]") {
    SECTION("Column letters") {
        REQUIRE(finvar::columnToLetters(1) == "A");
        REQUIRE(finvar::columnToLetters(26) == "Z");
        REQUIRE(finvar::columnToLetters(27) == "AA");
        REQUIRE(finvar::columnToLetters(703) == "AAA");
        REQUIRE(finvar::lettersToColumn("aa") == 27);
        REQUIRE(finvar::lettersToColumn("XFD") == 16384);
        REQUIRE(finvar::lettersToColumn("ABCD") == 0);
        REQUIRE(finvar::lettersToColumn("A1") == 0);
    }

    SECTION("Parse addresses") {
        auto rc = finvar::parseCellAddress("C14");
        REQUIRE(rc);
        REQUIRE(rc->first == 14);
        REQUIRE(rc->second == 3);

        auto absolute = finvar::parseCellAddress("$B$2");
        REQUIRE(absolute);
        REQUIRE(*absolute == std::make_pair(2, 2));

        REQUIRE_FALSE(finvar::parseCellAddress("C"));
        REQUIRE_FALSE(finvar::parseCellAddress("14"));
        REQUIRE_FALSE(finvar::parseCellAddress("C0"));
        REQUIRE_FALSE(finvar::parseCellAddress("C14x"));
    }

    SECTION("Sheet name quoting") {
        REQUIRE(finvar::quoteSheetName("IS") == "IS");
        REQUIRE(finvar::quoteSheetName("Income Statement") == "'Income Statement'");
        REQUIRE(finvar::quoteSheetName("Bob's") == "'Bob''s'");
        REQUIRE(finvar::quoteSheetName("2024") == "'2024'");
    }
}

TEST_CASE("Sheet cells", "[workbook]") {
    finvar::Sheet sheet("IS");
    sheet.setValue(1, 2, std::string("FY2024"));
    sheet.setValue("B5", 120.0);
    sheet.setFormula("B7", "=B5-B6", 100.0);

    REQUIRE(sheet.maxRow() == 7);
    REQUIRE(sheet.maxColumn() == 2);
    REQUIRE(sheet.cellCount() == 3);

    const auto* revenue = sheet.cell("B5");
    REQUIRE(revenue != nullptr);
    REQUIRE(revenue->numericValue() == 120.0);
    REQUIRE_FALSE(revenue->hasFormula());
    REQUIRE(revenue->qualifiedAddress() == "IS!B5");

    const auto* profit = sheet.cell(7, 2);
    REQUIRE(profit != nullptr);
    REQUIRE(profit->hasFormula());
    REQUIRE(*profit->formula == "=B5-B6");
    REQUIRE(profit->numericValue() == 100.0);

    REQUIRE(sheet.cell(6, 2) == nullptr);
    REQUIRE_THROWS_AS(sheet.setValue(0, 1, 1.0), std::out_of_range);
    REQUIRE_THROWS_AS(sheet.setValue("1A", 1.0), std::invalid_argument);
}

TEST_CASE("Row labels skip blank text", "[workbook]") {
    finvar::Sheet sheet("IS");
    sheet.setValue(3, 1, std::string("   "));
    sheet.setValue(3, 2, std::string("Revenue"));
    REQUIRE(sheet.rowLabel(3) == std::optional<std::string>("Revenue"));
    REQUIRE_FALSE(sheet.rowLabel(3, 1));
    REQUIRE_FALSE(sheet.rowLabel(4));
}

TEST_CASE("Workbook sheets and defined names", "[workbook]") {
    finvar::WorkbookModel workbook("model");
    workbook.addSheet("Income Statement").setValue("A1", std::string("Revenue"));
    workbook.addSheet("Inputs");
    workbook.defineName("TaxRate", "=Inputs!$B$2");

    REQUIRE(workbook.sheetNames() == std::vector<std::string>{"Income Statement", "Inputs"});
    REQUIRE(workbook.sheet("income statement") != nullptr);
    REQUIRE(workbook.sheet("Cash Flow") == nullptr);
    REQUIRE(workbook.definedName("taxrate") == std::optional<std::string>("Inputs!$B$2"));
    REQUIRE_FALSE(workbook.definedName("Missing"));
    REQUIRE(workbook.cell("Income Statement", 1, 1) != nullptr);
    REQUIRE(workbook.cell("Nowhere", 1, 1) == nullptr);
}

TEST_CASE("Load workbook from JSON", "[workbook]") {
    SECTION("Dense rows and sparse cells") {
        const std::string text = R"({
            "name": "Budget v1",
            "sheets": [{
                "name": "IS",
                "rows": [
                    [null, "FY2023", "FY2024"],
                    ["Revenue", 100, 120],
                    ["COGS", 40, "=C2*0.4"]
                ],
                "cells": [
                    {"ref": "C4", "value": 72, "formula": "C2-C3"},
                    {"ref": "D2", "value": "#DIV/0!"},
                    {"ref": "D3", "value": true}
                ]
            }],
            "definedNames": {"Growth": "IS!$C$2"}
        })";

        auto result = finvar::loadWorkbookFromJSON(text);
        REQUIRE(result.success);
        const auto& wb = *result.workbook;
        REQUIRE(wb.name() == "Budget v1");

        const auto* is = wb.sheet("IS");
        REQUIRE(is != nullptr);
        REQUIRE(std::get<std::string>(is->cell("B1")->rawValue) == "FY2023");
        REQUIRE(is->cell("A1") == nullptr);
        REQUIRE(is->cell("B2")->numericValue() == 100.0);

        const auto* cogs = is->cell("C3");
        REQUIRE(cogs->hasFormula());
        REQUIRE_FALSE(cogs->numericValue());

        const auto* gross = is->cell("C4");
        REQUIRE(*gross->formula == "=C2-C3");
        REQUIRE(gross->numericValue() == 72.0);

        REQUIRE(std::holds_alternative<finvar::ErrorValue>(is->cell("D2")->rawValue));
        REQUIRE(std::get<bool>(is->cell("D3")->rawValue));
        REQUIRE(wb.definedName("GROWTH") == std::optional<std::string>("IS!$C$2"));
    }

    SECTION("Malformed input is reported, not thrown") {
        auto notJson = finvar::loadWorkbookFromJSON("{ nope", "broken.json");
        REQUIRE_FALSE(notJson.success);
        REQUIRE_THAT(notJson.errorMessage, ContainsSubstring("broken.json"));

        auto noSheets = finvar::loadWorkbookFromJSON(R"({"name": "x"})");
        REQUIRE_FALSE(noSheets.success);
        REQUIRE_THAT(noSheets.errorMessage, ContainsSubstring("sheets"));

        auto duplicate = finvar::loadWorkbookFromJSON(
            R"({"sheets": [{"name": "IS"}, {"name": "IS"}]})");
        REQUIRE_FALSE(duplicate.success);
        REQUIRE_THAT(duplicate.errorMessage, ContainsSubstring("duplicate"));

        auto badRef = finvar::loadWorkbookFromJSON(
            R"({"sheets": [{"name": "IS", "cells": [{"ref": "??", "value": 1}]}]})");
        REQUIRE_FALSE(badRef.success);
    }

    SECTION("Missing file") {
        auto result = finvar::loadWorkbookFile("/nonexistent/finvar/model.json");
        REQUIRE_FALSE(result.success);
        REQUIRE_THAT(result.errorMessage, ContainsSubstring("Could not open file"));
    }
}
