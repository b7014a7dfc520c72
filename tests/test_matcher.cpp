#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finvar/matcher.h"

using Catch::Matchers::WithinAbs;

namespace {

finvar::LineItem item(const std::string& name, int row) {
    finvar::LineItem li;
    li.name = name;
    li.sheet = "IS";
    li.row = row;
    li.labelColumn = 1;
    return li;
}

std::vector<finvar::Period> periods(const std::vector<std::string>& labels) {
    std::vector<finvar::Period> out;
    int col = 2;
    for (const auto& label : labels) {
        finvar::Period p;
        p.label = label;
        p.columnIndex = col++;
        p.sheet = "IS";
        p.headerRow = 1;
        out.push_back(p);
    }
    return out;
}

}  // namespace

TEST_CASE("Label similarity", "[match]") {
    SECTION("Edit distance") {
        REQUIRE(finvar::editDistance("kitten", "sitting") == 3);
        REQUIRE(finvar::editDistance("", "abc") == 3);
        REQUIRE(finvar::editDistance("same", "same") == 0);
        REQUIRE(finvar::editRatio("", "") == 1.0);
        REQUIRE_THAT(finvar::editRatio("revenue", "revenues"), WithinAbs(0.875, 1e-12));
    }

    SECTION("Tokens") {
        auto tokens = finvar::tokenizeLabel("Cost of Goods Sold (COGS) - cost");
        REQUIRE(tokens == std::vector<std::string>{"cost", "of", "goods", "sold", "cogs"});
    }

    SECTION("Soft token Jaccard") {
        REQUIRE(finvar::softTokenJaccard("Total Revenue", "total revenues") == 1.0);
        REQUIRE(finvar::softTokenJaccard("Net Income", "Net Loss") == 1.0 / 3.0);
        REQUIRE(finvar::softTokenJaccard("", "") == 1.0);
        REQUIRE(finvar::softTokenJaccard("Revenue", "") == 0.0);
    }

    SECTION("Combined score") {
        REQUIRE(finvar::labelSimilarity("Revenue", "revenue") == 1.0);
        REQUIRE(finvar::labelSimilarity("Total Revenue", "Total Revenues") > 0.9);
        REQUIRE(finvar::labelSimilarity("Revenue", "Operating Expenses") < 0.5);
    }
}

TEST_CASE("Line item matching", "[match]") {
    finvar::LineItemMatcher matcher;

    SECTION("Exact matches have confidence 1") {
        auto result = matcher.match({item("Revenue", 2), item("COGS", 3)},
                                    {item("COGS", 5), item("Revenue", 4)});
        REQUIRE(result.pairs.size() == 2);
        REQUIRE(result.exactCount == 2);
        REQUIRE(result.pairs[0].kind == finvar::MatchKind::Exact);
        REQUIRE(result.pairs[0].confidence == 1.0);
        REQUIRE(result.pairs[0].newItem->row == 4);
        REQUIRE(result.pairs[1].newItem->row == 5);
        REQUIRE(result.findings.empty());
    }

    SECTION("Case differences still match exactly") {
        auto result = matcher.match({item("Net Income", 2)}, {item("NET INCOME ", 2)});
        REQUIRE(result.exactCount == 1);
        REQUIRE(result.pairs[0].confidence == 1.0);
    }

    SECTION("Fuzzy match above threshold") {
        auto result = matcher.match({item("Total Revenue", 2)}, {item("Total Revenues", 2)});
        REQUIRE(result.fuzzyCount == 1);
        const auto& pair = result.pairs[0];
        REQUIRE(pair.kind == finvar::MatchKind::Fuzzy);
        REQUIRE(pair.isMatched());
        REQUIRE(pair.confidence >= 0.8);
        REQUIRE(pair.confidence < 1.0);
        REQUIRE(pair.displayName() == "Total Revenue");
    }

    SECTION("Unmatched items on each side") {
        auto result = matcher.match({item("Revenue", 2), item("Cost of Goods Sold", 3)},
                                    {item("Revenue", 2), item("COGS", 3), item("Deferred Revenue", 4)});
        REQUIRE(result.exactCount == 1);
        REQUIRE(result.oldOnlyCount == 1);
        REQUIRE(result.newOnlyCount == 2);
        REQUIRE(result.pairs.size() == 4);

        // Old order first, then new-only in new order
        REQUIRE(result.pairs[1].kind == finvar::MatchKind::OldOnly);
        REQUIRE(result.pairs[1].displayName() == "Cost of Goods Sold");
        REQUIRE_FALSE(result.pairs[1].newItem);
        REQUIRE(result.pairs[2].kind == finvar::MatchKind::NewOnly);
        REQUIRE(result.pairs[2].displayName() == "COGS");
        REQUIRE(result.pairs[3].displayName() == "Deferred Revenue");

        REQUIRE(result.findings.size() == 3);
        REQUIRE(result.findings[0].code == "OldOnlyLineItem");
        REQUIRE(result.findings[0].location.side == finvar::ModelSide::Old);
        REQUIRE(result.findings[1].code == "NewOnlyLineItem");
        REQUIRE(finvar::countFindings(result.findings, finvar::ErrorCategory::MatchingWarning) == 3);
    }

    SECTION("Each item is used at most once") {
        auto result = matcher.match({item("Revenue", 2), item("Revenue", 3)}, {item("Revenue", 2)});
        REQUIRE(result.exactCount == 1);
        REQUIRE(result.oldOnlyCount == 1);
        REQUIRE(result.pairs[0].newItem);
        REQUIRE_FALSE(result.pairs[1].newItem);
    }

    SECTION("Higher fuzzy scores win") {
        auto result = matcher.match({item("Operating Income", 2)},
                                    {item("Operating Incomes", 2), item("Operating Income Total", 3)});
        REQUIRE(result.fuzzyCount == 1);
        REQUIRE(result.pairs[0].newItem->name == "Operating Incomes");
    }

    SECTION("Threshold is configurable") {
        finvar::EngineOptions strict;
        strict.fuzzyThreshold = 0.99;
        finvar::LineItemMatcher strictMatcher(strict);
        auto result = strictMatcher.match({item("Total Revenue", 2)}, {item("Total Revenues", 2)});
        REQUIRE(result.fuzzyCount == 0);
        REQUIRE(result.oldOnlyCount == 1);
        REQUIRE(result.newOnlyCount == 1);
    }
}

TEST_CASE("Period alignment", "[match]") {
    SECTION("Canonical keys") {
        REQUIRE(finvar::canonicalPeriodKey("Q1 2024") == "2024-Q1");
        REQUIRE(finvar::canonicalPeriodKey("1Q24") == "2024-Q1");
        REQUIRE(finvar::canonicalPeriodKey("2024 Q1") == "2024-Q1");
        REQUIRE(finvar::canonicalPeriodKey("FY1Q24") == "FY2024-Q1");
        REQUIRE(finvar::canonicalPeriodKey("FY24") == "FY2024");
        REQUIRE(finvar::canonicalPeriodKey("2024E") == "2024");
        REQUIRE(finvar::canonicalPeriodKey("Mar-24") == "2024-M03");
        REQUIRE(finvar::canonicalPeriodKey("3/2024") == "2024-M03");
        REQUIRE(finvar::canonicalPeriodKey("H2 2023") == "2023-H2");
        REQUIRE(finvar::canonicalPeriodKey("Budget") == "budget");
        REQUIRE(finvar::canonicalPeriodKey("Sept 2024") == "2024-M09");
        REQUIRE(finvar::canonicalPeriodKey("December 2023") == "2023-M12");
        // Words that merely start like a month keep their own key
        REQUIRE(finvar::canonicalPeriodKey("Marketing 24") == "marketing 24");
        REQUIRE(finvar::canonicalPeriodKey("Decline 2024") == "decline 2024");
        REQUIRE(finvar::canonicalPeriodKey("Junk-24") == "junk-24");
    }

    SECTION("Exact labels align before canonical ones") {
        auto alignment = finvar::alignPeriods(periods({"Q1 2024", "Q2 2024", "Q3 2024"}),
                                              periods({"1Q24", "Q2 2024", "Q4 2024"}));
        REQUIRE(alignment.common.size() == 2);
        REQUIRE(alignment.common[0].oldLabel == "Q1 2024");
        REQUIRE(alignment.common[0].newLabel == "1Q24");
        REQUIRE_FALSE(alignment.common[0].exact);
        REQUIRE(alignment.common[1].newLabel == "Q2 2024");
        REQUIRE(alignment.common[1].exact);
        REQUIRE(alignment.oldOnly == std::vector<std::string>{"Q3 2024"});
        REQUIRE(alignment.newOnly == std::vector<std::string>{"Q4 2024"});
    }

    SECTION("Resolve the selected period per side") {
        auto side = periods({"FY2023", "1Q24", "2Q24"});
        REQUIRE(finvar::resolvePeriodLabel("1Q24", side) == std::optional<std::string>("1Q24"));
        REQUIRE(finvar::resolvePeriodLabel("Q2 2024", side) == std::optional<std::string>("2Q24"));
        REQUIRE_FALSE(finvar::resolvePeriodLabel("Q3 2024", side));
    }
}
