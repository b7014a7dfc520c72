#include <catch2/catch_test_macros.hpp>
#include "finvar/formula_parser.h"

using namespace finvar;

TEST_CASE("Formula parsing", "[formula]") {
    FormulaParser parser;

    SECTION("Leading equals sign is optional") {
        REQUIRE(parser.parse("=B2-B3").success);
        REQUIRE(parser.parse("B2-B3").success);
        REQUIRE(parser.parse("  =B2 - B3  ").success);
    }

    SECTION("Binary operators fold left") {
        auto result = parser.parse("=A1-A2-A3");
        REQUIRE(result.success);
        REQUIRE(result.ast->is<BinaryOp>());
        REQUIRE(formulaToString(result.ast) == "((A1 - A2) - A3)");
    }

    SECTION("Multiplication binds tighter than addition") {
        auto result = parser.parse("=A1+A2*2");
        REQUIRE(result.success);
        REQUIRE(formulaToString(result.ast) == "(A1 + (A2 * 2))");
    }

    SECTION("Functions, strings and literals") {
        auto result = parser.parse("=IF(A1>0,\"a\"\"b\",#N/A)");
        REQUIRE(result.success);
        REQUIRE(result.ast->is<FunctionCall>());
        const auto& call = result.ast->as<FunctionCall>();
        REQUIRE(call.name == "IF");
        REQUIRE(call.args.size() == 3);
        REQUIRE(call.args[1]->as<StringLiteral>().value == "a\"b");
        REQUIRE(call.args[2]->as<ErrorLiteral>().code == "#N/A");
    }

    SECTION("Empty argument slots") {
        auto result = parser.parse("=IF(A1,,B1)");
        REQUIRE(result.success);
        const auto& call = result.ast->as<FunctionCall>();
        REQUIRE(call.args.size() == 3);
        REQUIRE(call.args[1]->is<MissingArgument>());

        auto noArgs = parser.parse("=TODAY()");
        REQUIRE(noArgs.success);
        REQUIRE(noArgs.ast->as<FunctionCall>().args.empty());
    }

    SECTION("Function names are upper-cased and lose the _xlfn prefix") {
        auto result = parser.parse("=_xlfn.xlookup(A1,B:B,C:C)");
        REQUIRE(result.success);
        REQUIRE(result.functions == std::vector<std::string>{"XLOOKUP"});
        REQUIRE(result.operands.size() == 3);
        REQUIRE(result.operands[1].reference->wholeColumns);
    }

    SECTION("Booleans and percentages") {
        auto result = parser.parse("=AND(TRUE,A1%>0)");
        REQUIRE(result.success);
        const auto& call = result.ast->as<FunctionCall>();
        REQUIRE(call.args[0]->as<BooleanLiteral>().value);
        REQUIRE(formulaToString(call.args[1]) == "(A1% > 0)");
    }

    SECTION("Nesting depth") {
        auto result = parser.parse("=IF(A1>0,SUM(B1,B2),0)");
        REQUIRE(result.success);
        REQUIRE(result.nestingDepth == 2);
        REQUIRE(result.functions == std::vector<std::string>{"IF", "SUM"});

        REQUIRE(parser.parse("=A1+A2").nestingDepth == 0);
    }

    SECTION("Array formula braces") {
        auto result = parser.parse("{=SUM(A1:A3)}");
        REQUIRE(result.success);
        REQUIRE(result.functions == std::vector<std::string>{"SUM"});
    }

    SECTION("Unparseable input is reported, not thrown") {
        auto unbalanced = parser.parse("=SUM(A1");
        REQUIRE_FALSE(unbalanced.success);
        REQUIRE_FALSE(unbalanced.errorMessage.empty());
        REQUIRE(unbalanced.ast == nullptr);

        auto dangling = parser.parse("=1+");
        REQUIRE_FALSE(dangling.success);

        auto empty = parser.parse("=");
        REQUIRE_FALSE(empty.success);
        REQUIRE(empty.errorMessage == "empty formula");

        // The parser is reusable after a failure
        REQUIRE(parser.parse("=A1").success);
    }
}

TEST_CASE("Operand extraction", "[formula]") {
    FormulaParser parser;

    SECTION("Subtraction negates the right side") {
        auto result = parser.parse("=B2-B3");
        REQUIRE(result.operands.size() == 2);
        REQUIRE(result.operands[0].text() == "B2");
        REQUIRE(result.operands[0].coefficient == 1.0);
        REQUIRE(result.operands[0].additive);
        REQUIRE(result.operands[1].text() == "B3");
        REQUIRE(result.operands[1].coefficient == -1.0);
        REQUIRE(result.operands[1].additive);
    }

    SECTION("Unary minus and parentheses") {
        auto result = parser.parse("=-(A1-A2)+A3");
        REQUIRE(result.operands.size() == 3);
        REQUIRE(result.operands[0].coefficient == -1.0);
        REQUIRE(result.operands[1].coefficient == 1.0);
        REQUIRE(result.operands[2].coefficient == 1.0);
    }

    SECTION("SUM keeps the additive context") {
        auto result = parser.parse("=SUM(B2:B5)-SUM(C1,C2)");
        REQUIRE(result.operands.size() == 3);

        const auto& range = *result.operands[0].reference;
        REQUIRE(range.isRange);
        REQUIRE(range.start.row == 2);
        REQUIRE(range.end.row == 5);
        REQUIRE(range.start.col == 2);
        REQUIRE(result.operands[0].coefficient == 1.0);

        REQUIRE(result.operands[1].coefficient == -1.0);
        REQUIRE(result.operands[2].coefficient == -1.0);
    }

    SECTION("Other operators are non-additive") {
        auto result = parser.parse("=B2*1.1-B3/2");
        REQUIRE(result.operands.size() == 2);
        for (const auto& op : result.operands) {
            REQUIRE_FALSE(op.additive);
            REQUIRE(op.coefficient == 1.0);
        }

        auto rounded = parser.parse("=ROUND(A1-A2,0)");
        REQUIRE(rounded.operands.size() == 2);
        REQUIRE_FALSE(rounded.operands[1].additive);
        REQUIRE(rounded.operands[1].coefficient == 1.0);
    }

    SECTION("Cross-sheet and external references") {
        auto result = parser.parse("=Inputs!B2+'My Sheet'!$C$3");
        REQUIRE(result.hasCrossSheetReference);
        REQUIRE_FALSE(result.hasExternalReference);
        REQUIRE(result.operands.size() == 2);
        REQUIRE(*result.operands[0].reference->sheet == "Inputs");
        const auto& quoted = *result.operands[1].reference;
        REQUIRE(*quoted.sheet == "My Sheet");
        REQUIRE(quoted.start.absoluteCol);
        REQUIRE(quoted.start.absoluteRow);
        REQUIRE(quoted.text == "'My Sheet'!$C$3");

        auto external = parser.parse("=[Budget.xlsx]Data!A1*2");
        REQUIRE(external.success);
        REQUIRE(external.hasExternalReference);
        REQUIRE(external.operands[0].isExternal());
        REQUIRE(*external.operands[0].reference->workbook == "Budget.xlsx");
        REQUIRE(*external.operands[0].reference->sheet == "Data");
    }

    SECTION("Defined names") {
        auto result = parser.parse("=TaxRate*B2");
        REQUIRE(result.operands.size() == 2);
        REQUIRE(result.operands[0].isName());
        REQUIRE(result.operands[0].name == "TAXRATE");
        REQUIRE_FALSE(result.operands[0].additive);
        REQUIRE_FALSE(result.operands[1].isName());
    }

    SECTION("Operands come in source order") {
        auto result = parser.parse("=C1+A1+B1");
        REQUIRE(result.operands[0].text() == "C1");
        REQUIRE(result.operands[1].text() == "A1");
        REQUIRE(result.operands[2].text() == "B1");
        REQUIRE(result.operands[0].position < result.operands[1].position);
    }
}

TEST_CASE("Reference tokens", "[formula]") {
    SECTION("Single cells") {
        auto ref = parseReferenceToken("$C$14");
        REQUIRE(ref);
        REQUIRE_FALSE(ref->isRange);
        REQUIRE(ref->start.col == 3);
        REQUIRE(ref->start.row == 14);
        REQUIRE(ref->end.row == 14);
        REQUIRE(ref->start.toString() == "$C$14");
    }

    SECTION("Quoted sheet names unescape doubled quotes") {
        auto ref = parseReferenceToken("'Bob''s'!A1");
        REQUIRE(ref);
        REQUIRE(*ref->sheet == "Bob's");
        REQUIRE(ref->start.toString() == "'Bob''s'!A1");
    }

    SECTION("Row and column ranges") {
        auto rows = parseReferenceToken("1:3");
        REQUIRE(rows);
        REQUIRE(rows->isRange);
        REQUIRE(rows->start.col == 0);
        REQUIRE(rows->end.row == 3);
        REQUIRE_FALSE(rows->wholeColumns);

        auto cols = parseReferenceToken("IS!A:C");
        REQUIRE(cols);
        REQUIRE(cols->wholeColumns);
        REQUIRE(cols->end.col == 3);
        REQUIRE(*cols->end.sheet == "IS");
    }

    SECTION("External workbook with a path") {
        auto ref = parseReferenceToken("'C:\\models\\[Plan.xlsx]IS'!B2");
        REQUIRE(ref);
        REQUIRE(ref->isExternal());
        REQUIRE(*ref->workbook == "C:\\models\\Plan.xlsx");
        REQUIRE(*ref->sheet == "IS");
    }

    SECTION("Non-references") {
        REQUIRE_FALSE(parseReferenceToken("Revenue"));
        REQUIRE_FALSE(parseReferenceToken("ZZ"));
        REQUIRE_FALSE(parseReferenceToken("A0"));
        REQUIRE_FALSE(parseReferenceToken("!A1"));
    }
}

TEST_CASE("Formula complexity preview", "[formula]") {
    SECTION("No formula") {
        auto info = analyzeFormulaComplexity("");
        REQUIRE_FALSE(info.hasFormula);
        REQUIRE_FALSE(info.canDrillDown);
    }

    SECTION("Simple same-sheet arithmetic") {
        auto info = analyzeFormulaComplexity("=B2-B3");
        REQUIRE(info.complexity == FormulaComplexity::Simple);
        REQUIRE(info.referenceCount == 2);
        REQUIRE(info.canDrillDown);
        REQUIRE(info.mainFunction.empty());
    }

    SECTION("Cross-sheet or many references") {
        REQUIRE(analyzeFormulaComplexity("=Inputs!B2*B3").complexity == FormulaComplexity::Moderate);

        auto info = analyzeFormulaComplexity("=SUM(A1,B1,C1,D1)");
        REQUIRE(info.complexity == FormulaComplexity::Moderate);
        REQUIRE(info.mainFunction == "SUM");
    }

    SECTION("External links, deep nesting and parse failures") {
        auto external = analyzeFormulaComplexity("=[Plan.xlsx]IS!B2");
        REQUIRE(external.complexity == FormulaComplexity::Complex);
        REQUIRE_FALSE(external.canDrillDown);

        auto deep = analyzeFormulaComplexity("=ROUND(ABS(MAX(MIN(A1,1),0)),2)");
        REQUIRE(deep.nestingDepth == 4);
        REQUIRE(deep.complexity == FormulaComplexity::Complex);

        auto broken = analyzeFormulaComplexity("=SUM(");
        REQUIRE(broken.hasFormula);
        REQUIRE(broken.complexity == FormulaComplexity::Complex);
        REQUIRE(broken.referenceCount == 0);
    }

    SECTION("Names") {
        REQUIRE(complexityToString(FormulaComplexity::Moderate) == "moderate");
    }
}
