#pragma once

#include "formula_ast.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Operands
// ============================================================================

/**
 * @brief A reference (or defined name) found in a formula, in source order.
 *
 * coefficient is +1 or -1 when the operand sits in a purely additive chain
 * (unary/binary +/-, SUM arguments). additive is false when the operand is
 * nested under any other operator or function; the coefficient is then +1.
 */
struct Operand {
    std::optional<Reference> reference;  // Absent for defined names
    std::string name;                    // Defined name (upper-cased); empty for references
    double coefficient = 1.0;
    bool additive = true;
    int position = 0;

    bool isName() const { return !reference.has_value(); }
    bool isExternal() const { return reference && reference->isExternal(); }
    std::string text() const { return reference ? reference->text : name; }
};

// ============================================================================
// Parse Result
// ============================================================================

struct FormulaParseResult {
    bool success = false;
    std::string formula;                 // Input text as given
    FormulaExprPtr ast;
    std::vector<Operand> operands;
    std::vector<std::string> functions;  // Upper-cased, in order of first use
    bool hasExternalReference = false;
    bool hasCrossSheetReference = false;
    int nestingDepth = 0;                // Deepest function-call nesting
    std::string errorMessage;
    int errorColumn = 0;
};

// ============================================================================
// Formula Parser
// ============================================================================

/**
 * @brief PEG parser for spreadsheet formulas.
 *
 * Instances are not thread-safe; give each worker its own parser.
 * Unparseable input never throws: success is false and errorMessage set.
 */
class FormulaParser {
public:
    FormulaParser();
    ~FormulaParser();

    FormulaParser(const FormulaParser&) = delete;
    FormulaParser& operator=(const FormulaParser&) = delete;

    // Parse a formula, with or without the leading '='
    FormulaParseResult parse(const std::string& formula);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// ============================================================================
// Reference Helpers
// ============================================================================

// Split a reference token ("'My Sheet'!$A$1:$B$5", "[Book.xlsx]S!A1", "A:A")
// into its parts. nullopt if the token is not a reference.
std::optional<Reference> parseReferenceToken(const std::string& token);

// Collect operands with additive coefficients from an AST
void collectOperands(const FormulaExprPtr& expr, std::vector<Operand>& operands);

// ============================================================================
// Complexity Preview
// ============================================================================

enum class FormulaComplexity {
    Simple,
    Moderate,
    Complex
};

std::string complexityToString(FormulaComplexity complexity);

struct FormulaComplexityInfo {
    bool hasFormula = false;
    int referenceCount = 0;
    bool hasCrossSheet = false;
    bool hasExternal = false;
    std::string mainFunction;    // Outermost function, empty if none
    int nestingDepth = 0;
    FormulaComplexity complexity = FormulaComplexity::Simple;
    bool canDrillDown = false;
};

FormulaComplexityInfo analyzeFormulaComplexity(const std::string& formula);

}  // namespace finvar
