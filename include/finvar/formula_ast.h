#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace finvar {

// Forward declarations
struct FormulaExpr;

using FormulaExprPtr = std::shared_ptr<FormulaExpr>;

// ============================================================================
// References
// ============================================================================

struct CellRef {
    std::optional<std::string> sheet;  // Absent for same-sheet references
    int col = 0;                       // 1-based; 0 for whole-row/unknown
    int row = 0;                       // 1-based; 0 for whole-column references
    bool absoluteCol = false;
    bool absoluteRow = false;

    // "C14", "$C$14", "IS!C14"
    std::string toString() const;
};

/**
 * @brief A reference operand as written in the formula.
 *
 * Single cells have start == end and isRange == false. Whole-column ranges
 * ("A:A") leave row = 0 on both corners and set wholeColumns.
 */
struct Reference {
    std::string text;                  // Verbatim token
    std::optional<std::string> workbook;  // "[Book.xlsx]" part, without brackets
    std::optional<std::string> sheet;
    CellRef start;
    CellRef end;
    bool isRange = false;
    bool wholeColumns = false;

    bool isExternal() const { return workbook.has_value(); }
    bool isCrossSheet() const { return sheet.has_value(); }
};

// ============================================================================
// Expression Types
// ============================================================================

struct NumberLiteral {
    double value;
};

struct StringLiteral {
    std::string value;
};

struct BooleanLiteral {
    bool value;
};

struct ErrorLiteral {
    std::string code;  // "#REF!", "#N/A", ...
};

// Empty argument slot, e.g. the middle of IF(A1,,B1)
struct MissingArgument {};

struct ReferenceNode {
    Reference ref;
};

// Defined name or unrecognised identifier
struct NameNode {
    std::string name;
};

struct UnaryOp {
    std::string op;  // "-", "+", "%" (postfix)
    FormulaExprPtr operand;
};

struct BinaryOp {
    std::string op;  // "+", "-", "*", "/", "^", "&", "=", "<>", "<", ">", "<=", ">="
    FormulaExprPtr left;
    FormulaExprPtr right;
};

struct FunctionCall {
    std::string name;  // Upper-cased
    std::vector<FormulaExprPtr> args;
};

struct FormulaExpr {
    std::variant<
        NumberLiteral,
        StringLiteral,
        BooleanLiteral,
        ErrorLiteral,
        MissingArgument,
        ReferenceNode,
        NameNode,
        UnaryOp,
        BinaryOp,
        FunctionCall
    > node;

    int position = 0;  // Byte offset in the formula text

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    template<typename T>
    T& as() { return std::get<T>(node); }
};

// ============================================================================
// Helper functions for AST construction
// ============================================================================

inline FormulaExprPtr makeNumber(double value, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = NumberLiteral{value};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeString(const std::string& value, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = StringLiteral{value};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeBoolean(bool value, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = BooleanLiteral{value};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeError(const std::string& code, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = ErrorLiteral{code};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeMissing(int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = MissingArgument{};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeReference(Reference ref, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = ReferenceNode{std::move(ref)};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeName(const std::string& name, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = NameNode{name};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeUnaryOp(const std::string& op, FormulaExprPtr operand, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = UnaryOp{op, std::move(operand)};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeBinaryOp(const std::string& op, FormulaExprPtr left, FormulaExprPtr right, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = BinaryOp{op, std::move(left), std::move(right)};
    expr->position = pos;
    return expr;
}

inline FormulaExprPtr makeFunctionCall(const std::string& name, std::vector<FormulaExprPtr> args, int pos = 0) {
    auto expr = std::make_shared<FormulaExpr>();
    expr->node = FunctionCall{name, std::move(args)};
    expr->position = pos;
    return expr;
}

// Convert AST to string representation (for debugging and reports)
std::string formulaToString(const FormulaExprPtr& expr);

}  // namespace finvar
