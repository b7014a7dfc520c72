#include "finvar/formula_parser.h"
#include "finvar/workbook.h"
#include <peglib.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace finvar {

// ============================================================================
// Grammar
// ============================================================================

namespace {

// Excel precedence, loosest first: comparison, &, + -, * /, ^, unary sign, %.
// References are one token, split into sheet/workbook/area afterwards.
const char* kFormulaGrammar = R"GRAMMAR(
    Formula         <- Expression !.

    Expression      <- Comparison
    Comparison      <- Concat (CompareOp Concat)*
    CompareOp       <- < '<=' / '>=' / '<>' / '=' / '<' / '>' >
    Concat          <- Additive (ConcatOp Additive)*
    ConcatOp        <- < '&' >
    Additive        <- Multiplicative (AddOp Multiplicative)*
    AddOp           <- < [-+] >
    Multiplicative  <- Power (MulOp Power)*
    MulOp           <- < [*/] >
    Power           <- Unary (PowOp Unary)*
    PowOp           <- < '^' >
    Unary           <- SignOp* Postfix
    SignOp          <- < [-+] >
    Postfix         <- Primary PercentOp*
    PercentOp       <- < '%' >

    Primary         <- Parenthesized / FunctionCall / Reference / Number / String
                     / Boolean / ErrorValue / Name
    Parenthesized   <- '(' Expression ')'

    FunctionCall    <- FunctionName '(' ArgList? ')'
    FunctionName    <- < [A-Za-z_] [A-Za-z0-9_.]* >
    ArgList         <- Argument (',' Argument)*
    Argument        <- Expression / MissingArgument
    MissingArgument <- &[,)]

    Reference       <- < RefBody > !RefTail
    RefBody         <- SheetPrefix Area / Area
    SheetPrefix     <- QuotedSheet '!' / Workbook? SheetName '!'
    QuotedSheet     <- "'" ("''" / [^'])+ "'"
    Workbook        <- '[' [^\]]+ ']'
    SheetName       <- [A-Za-z_] [A-Za-z0-9_.]*
    Area            <- CellAddr (':' CellAddr)? / ColAddr ':' ColAddr / RowAddr ':' RowAddr
    CellAddr        <- '$'? ColLetters '$'? [0-9]+
    ColAddr         <- '$'? ColLetters
    RowAddr         <- '$'? [0-9]+
    ColLetters      <- [A-Za-z] [A-Za-z]? [A-Za-z]?
    RefTail         <- [A-Za-z0-9_.(!]

    Number          <- < ([0-9]+ ('.' [0-9]*)? / '.' [0-9]+) ([eE] [-+]? [0-9]+)? >
    String          <- < '"' ('""' / [^"])* '"' >
    Boolean         <- < 'TRUE'i / 'FALSE'i > ![A-Za-z0-9_.(]
    ErrorValue      <- < '#' ('NULL!'i / 'DIV/0!'i / 'VALUE!'i / 'REF!'i / 'NAME?'i / 'NUM!'i / 'N/A'i
                            / 'GETTING_DATA'i / 'SPILL!'i / 'CALC!'i) >
    Name            <- < [A-Za-z_\\] [A-Za-z0-9_.]* >

    %whitespace     <- [ \t\r\n]*
)GRAMMAR";

std::string toUpper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

int positionOf(const peg::SemanticValues& vs) {
    return static_cast<int>(vs.line_info().second) - 1;
}

// Fold "a op b op c" left-associatively
FormulaExprPtr foldBinary(const peg::SemanticValues& vs) {
    auto result = std::any_cast<FormulaExprPtr>(vs[0]);
    for (size_t i = 1; i + 1 < vs.size(); i += 2) {
        auto op = std::any_cast<std::string>(vs[i]);
        auto rhs = std::any_cast<FormulaExprPtr>(vs[i + 1]);
        result = makeBinaryOp(op, result, rhs, result->position);
    }
    return result;
}

// Parse one corner ("$C$14", "C" or "14") into a CellRef
bool parseCorner(const std::string& text, CellRef& ref) {
    size_t i = 0;
    if (i < text.size() && text[i] == '$') {
        ref.absoluteCol = true;
        ++i;
    }
    size_t letterStart = i;
    while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) ++i;
    std::string letters = text.substr(letterStart, i - letterStart);
    if (letters.empty()) {
        // Row-only corner: the '$' belonged to the row
        ref.absoluteRow = ref.absoluteCol;
        ref.absoluteCol = false;
    } else {
        ref.col = lettersToColumn(letters);
        if (ref.col == 0) return false;
        if (i < text.size() && text[i] == '$') {
            ref.absoluteRow = true;
            ++i;
        }
    }
    size_t digitStart = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i != text.size()) return false;
    if (digitStart < i) {
        ref.row = std::stoi(text.substr(digitStart));
        if (ref.row <= 0) return false;
    }
    return ref.col > 0 || ref.row > 0;
}

}  // namespace

// ============================================================================
// Reference Helpers
// ============================================================================

std::string CellRef::toString() const {
    std::string out;
    if (sheet) out += quoteSheetName(*sheet) + "!";
    if (col > 0) {
        if (absoluteCol) out += "$";
        out += columnToLetters(col);
    }
    if (row > 0) {
        if (absoluteRow) out += "$";
        out += std::to_string(row);
    }
    return out;
}

std::optional<Reference> parseReferenceToken(const std::string& token) {
    Reference ref;
    ref.text = token;

    std::string area = token;
    size_t bang = token.rfind('!');
    if (bang != std::string::npos) {
        std::string prefix = token.substr(0, bang);
        area = token.substr(bang + 1);
        if (prefix.size() >= 2 && prefix.front() == '\'' && prefix.back() == '\'') {
            std::string unquoted;
            for (size_t i = 1; i + 1 < prefix.size(); ++i) {
                unquoted += prefix[i];
                if (prefix[i] == '\'' && i + 2 < prefix.size() && prefix[i + 1] == '\'') ++i;
            }
            prefix = unquoted;
        }
        // "C:\dir\[Book.xlsx]Sheet" or "[Book.xlsx]Sheet"
        size_t open = prefix.find('[');
        size_t close = prefix.find(']');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            ref.workbook = prefix.substr(0, open) + prefix.substr(open + 1, close - open - 1);
            prefix = prefix.substr(close + 1);
        }
        if (prefix.empty()) return std::nullopt;
        ref.sheet = prefix;
    }

    std::string first = area;
    std::string second;
    size_t colon = area.find(':');
    if (colon != std::string::npos) {
        first = area.substr(0, colon);
        second = area.substr(colon + 1);
        ref.isRange = true;
    }

    if (!parseCorner(first, ref.start)) return std::nullopt;
    if (ref.isRange) {
        if (!parseCorner(second, ref.end)) return std::nullopt;
    } else {
        if (ref.start.col == 0 || ref.start.row == 0) return std::nullopt;
        ref.end = ref.start;
    }
    ref.wholeColumns = ref.isRange && ref.start.row == 0 && ref.end.row == 0;
    ref.start.sheet = ref.sheet;
    ref.end.sheet = ref.sheet;
    return ref;
}

static void collectOperandsImpl(const FormulaExprPtr& expr, std::vector<Operand>& operands,
                               double coefficient, bool additive) {
    if (!expr) return;

    if (expr->is<ReferenceNode>()) {
        Operand op;
        op.reference = expr->as<ReferenceNode>().ref;
        op.coefficient = additive ? coefficient : 1.0;
        op.additive = additive;
        op.position = expr->position;
        operands.push_back(op);
    } else if (expr->is<NameNode>()) {
        Operand op;
        op.name = toUpper(expr->as<NameNode>().name);
        op.coefficient = additive ? coefficient : 1.0;
        op.additive = additive;
        op.position = expr->position;
        operands.push_back(op);
    } else if (expr->is<UnaryOp>()) {
        const auto& u = expr->as<UnaryOp>();
        if (u.op == "-") collectOperandsImpl(u.operand, operands, -coefficient, additive);
        else if (u.op == "+") collectOperandsImpl(u.operand, operands, coefficient, additive);
        else collectOperandsImpl(u.operand, operands, 1.0, false);
    } else if (expr->is<BinaryOp>()) {
        const auto& b = expr->as<BinaryOp>();
        if (b.op == "+") {
            collectOperandsImpl(b.left, operands, coefficient, additive);
            collectOperandsImpl(b.right, operands, coefficient, additive);
        } else if (b.op == "-") {
            collectOperandsImpl(b.left, operands, coefficient, additive);
            collectOperandsImpl(b.right, operands, -coefficient, additive);
        } else {
            collectOperandsImpl(b.left, operands, 1.0, false);
            collectOperandsImpl(b.right, operands, 1.0, false);
        }
    } else if (expr->is<FunctionCall>()) {
        const auto& f = expr->as<FunctionCall>();
        bool keepsAdditive = f.name == "SUM";
        for (const auto& arg : f.args) {
            if (keepsAdditive) collectOperandsImpl(arg, operands, coefficient, additive);
            else collectOperandsImpl(arg, operands, 1.0, false);
        }
    }
}

void collectOperands(const FormulaExprPtr& expr, std::vector<Operand>& operands) {
    collectOperandsImpl(expr, operands, 1.0, true);
}

// ============================================================================
// AST printing
// ============================================================================

std::string formulaToString(const FormulaExprPtr& expr) {
    if (!expr) return "<null>";

    std::ostringstream ss;
    if (expr->is<NumberLiteral>()) {
        ss << expr->as<NumberLiteral>().value;
    } else if (expr->is<StringLiteral>()) {
        ss << "\"" << expr->as<StringLiteral>().value << "\"";
    } else if (expr->is<BooleanLiteral>()) {
        ss << (expr->as<BooleanLiteral>().value ? "TRUE" : "FALSE");
    } else if (expr->is<ErrorLiteral>()) {
        ss << expr->as<ErrorLiteral>().code;
    } else if (expr->is<MissingArgument>()) {
        // Empty slot
    } else if (expr->is<ReferenceNode>()) {
        ss << expr->as<ReferenceNode>().ref.text;
    } else if (expr->is<NameNode>()) {
        ss << expr->as<NameNode>().name;
    } else if (expr->is<UnaryOp>()) {
        const auto& u = expr->as<UnaryOp>();
        if (u.op == "%") ss << formulaToString(u.operand) << "%";
        else ss << u.op << formulaToString(u.operand);
    } else if (expr->is<BinaryOp>()) {
        const auto& b = expr->as<BinaryOp>();
        ss << "(" << formulaToString(b.left) << " " << b.op << " " << formulaToString(b.right) << ")";
    } else if (expr->is<FunctionCall>()) {
        const auto& f = expr->as<FunctionCall>();
        ss << f.name << "(";
        for (size_t i = 0; i < f.args.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << formulaToString(f.args[i]);
        }
        ss << ")";
    }
    return ss.str();
}

// ============================================================================
// Formula Parser Implementation
// ============================================================================

class FormulaParser::Impl {
public:
    Impl() : parser_(kFormulaGrammar) {
        if (!parser_) {
            throw std::logic_error("formula grammar failed to load");
        }
        setupActions();
        parser_.enable_packrat_parsing();
        parser_.set_logger([this](size_t /*line*/, size_t col, const std::string& msg) {
            if (lastError_.empty()) {
                lastError_ = msg;
                lastColumn_ = static_cast<int>(col);
            }
        });
    }

    FormulaParseResult parse(const std::string& formula);

private:
    peg::parser parser_;
    std::string lastError_;
    int lastColumn_ = 0;

    void setupActions();
};

void FormulaParser::Impl::setupActions() {
    auto& g = parser_;

    g["Formula"] = [](const peg::SemanticValues& vs) { return std::any_cast<FormulaExprPtr>(vs[0]); };
    g["Expression"] = [](const peg::SemanticValues& vs) { return std::any_cast<FormulaExprPtr>(vs[0]); };

    for (const char* rule : {"Comparison", "Concat", "Additive", "Multiplicative", "Power"}) {
        g[rule] = [](const peg::SemanticValues& vs) { return foldBinary(vs); };
    }
    for (const char* rule : {"CompareOp", "ConcatOp", "AddOp", "MulOp", "PowOp", "SignOp", "PercentOp",
                             "FunctionName"}) {
        g[rule] = [](const peg::SemanticValues& vs) { return vs.token_to_string(); };
    }

    g["Unary"] = [](const peg::SemanticValues& vs) {
        auto expr = std::any_cast<FormulaExprPtr>(vs[vs.size() - 1]);
        int pos = positionOf(vs);
        for (size_t i = vs.size() - 1; i-- > 0;) {
            expr = makeUnaryOp(std::any_cast<std::string>(vs[i]), expr, pos);
        }
        return expr;
    };

    g["Postfix"] = [](const peg::SemanticValues& vs) {
        auto expr = std::any_cast<FormulaExprPtr>(vs[0]);
        for (size_t i = 1; i < vs.size(); ++i) {
            expr = makeUnaryOp("%", expr, expr->position);
        }
        return expr;
    };

    g["Primary"] = [](const peg::SemanticValues& vs) { return std::any_cast<FormulaExprPtr>(vs[0]); };
    g["Parenthesized"] = [](const peg::SemanticValues& vs) { return std::any_cast<FormulaExprPtr>(vs[0]); };

    g["FunctionCall"] = [](const peg::SemanticValues& vs) {
        std::string name = toUpper(std::any_cast<std::string>(vs[0]));
        // Excel writes newer functions with a "_xlfn." prefix
        if (name.rfind("_XLFN.", 0) == 0) name = name.substr(6);
        std::vector<FormulaExprPtr> args;
        if (vs.size() > 1) {
            args = std::any_cast<std::vector<FormulaExprPtr>>(vs[1]);
        }
        // "F()" parses as a single empty slot
        if (args.size() == 1 && args[0]->is<MissingArgument>()) {
            args.clear();
        }
        return makeFunctionCall(name, std::move(args), positionOf(vs));
    };

    g["ArgList"] = [](const peg::SemanticValues& vs) {
        std::vector<FormulaExprPtr> args;
        for (size_t i = 0; i < vs.size(); ++i) {
            args.push_back(std::any_cast<FormulaExprPtr>(vs[i]));
        }
        return args;
    };

    g["Argument"] = [](const peg::SemanticValues& vs) { return std::any_cast<FormulaExprPtr>(vs[0]); };
    g["MissingArgument"] = [](const peg::SemanticValues& vs) { return makeMissing(positionOf(vs)); };

    g["Reference"] = [](const peg::SemanticValues& vs) {
        std::string token = vs.token_to_string();
        auto ref = parseReferenceToken(token);
        if (!ref) {
            return makeName(token, positionOf(vs));
        }
        return makeReference(*ref, positionOf(vs));
    };

    g["Number"] = [](const peg::SemanticValues& vs) {
        return makeNumber(std::stod(vs.token_to_string()), positionOf(vs));
    };

    g["String"] = [](const peg::SemanticValues& vs) {
        std::string token = vs.token_to_string();
        std::string value;
        for (size_t i = 1; i + 1 < token.size(); ++i) {
            value += token[i];
            if (token[i] == '"' && i + 2 < token.size() && token[i + 1] == '"') ++i;
        }
        return makeString(value, positionOf(vs));
    };

    g["Boolean"] = [](const peg::SemanticValues& vs) {
        return makeBoolean(toUpper(vs.token_to_string()) == "TRUE", positionOf(vs));
    };

    g["ErrorValue"] = [](const peg::SemanticValues& vs) {
        return makeError(toUpper(vs.token_to_string()), positionOf(vs));
    };

    g["Name"] = [](const peg::SemanticValues& vs) {
        return makeName(vs.token_to_string(), positionOf(vs));
    };
}

namespace {

void scanFunctions(const FormulaExprPtr& expr, std::vector<std::string>& functions,
                   int depth, int& maxDepth) {
    if (!expr) return;
    if (expr->is<FunctionCall>()) {
        const auto& f = expr->as<FunctionCall>();
        if (std::find(functions.begin(), functions.end(), f.name) == functions.end()) {
            functions.push_back(f.name);
        }
        maxDepth = std::max(maxDepth, depth + 1);
        for (const auto& arg : f.args) scanFunctions(arg, functions, depth + 1, maxDepth);
    } else if (expr->is<UnaryOp>()) {
        scanFunctions(expr->as<UnaryOp>().operand, functions, depth, maxDepth);
    } else if (expr->is<BinaryOp>()) {
        scanFunctions(expr->as<BinaryOp>().left, functions, depth, maxDepth);
        scanFunctions(expr->as<BinaryOp>().right, functions, depth, maxDepth);
    }
}

}  // namespace

FormulaParseResult FormulaParser::Impl::parse(const std::string& formula) {
    FormulaParseResult result;
    result.formula = formula;

    std::string text = formula;
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    text = text.substr(start);
    if (!text.empty() && text[0] == '=') text.erase(0, 1);
    // Array formulas are stored as {=...}
    if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, text.size() - 2);
        if (!text.empty() && text[0] == '=') text.erase(0, 1);
    }

    if (text.empty()) {
        result.errorMessage = "empty formula";
        return result;
    }

    lastError_.clear();
    lastColumn_ = 0;
    FormulaExprPtr ast;
    bool ok = false;
    try {
        ok = parser_.parse(text, ast);
    } catch (const std::exception& e) {
        // Thrown by an action, e.g. std::out_of_range from stod on "1e999"
        lastError_ = e.what();
        ok = false;
    }

    if (!ok || !ast) {
        result.errorMessage = lastError_.empty() ? "syntax error" : lastError_;
        result.errorColumn = lastColumn_;
        return result;
    }

    result.success = true;
    result.ast = ast;
    collectOperands(ast, result.operands);
    scanFunctions(ast, result.functions, 0, result.nestingDepth);
    for (const auto& op : result.operands) {
        if (op.isExternal()) result.hasExternalReference = true;
        if (op.reference && op.reference->isCrossSheet()) result.hasCrossSheetReference = true;
    }
    return result;
}

FormulaParser::FormulaParser() : pImpl(std::make_unique<Impl>()) {}
FormulaParser::~FormulaParser() = default;

FormulaParseResult FormulaParser::parse(const std::string& formula) {
    return pImpl->parse(formula);
}

// ============================================================================
// Complexity Preview
// ============================================================================

std::string complexityToString(FormulaComplexity complexity) {
    switch (complexity) {
        case FormulaComplexity::Simple: return "simple";
        case FormulaComplexity::Moderate: return "moderate";
        case FormulaComplexity::Complex: return "complex";
        default: return "unknown";
    }
}

FormulaComplexityInfo analyzeFormulaComplexity(const std::string& formula) {
    FormulaComplexityInfo info;
    if (formula.empty()) return info;
    info.hasFormula = true;

    FormulaParser parser;
    auto parsed = parser.parse(formula);
    if (!parsed.success) {
        info.complexity = FormulaComplexity::Complex;
        return info;
    }

    info.referenceCount = static_cast<int>(parsed.operands.size());
    info.hasCrossSheet = parsed.hasCrossSheetReference;
    info.hasExternal = parsed.hasExternalReference;
    info.nestingDepth = parsed.nestingDepth;
    if (parsed.ast && parsed.ast->is<FunctionCall>()) {
        info.mainFunction = parsed.ast->as<FunctionCall>().name;
    } else if (!parsed.functions.empty()) {
        info.mainFunction = parsed.functions.front();
    }

    if (info.hasExternal || info.referenceCount > 10 || info.nestingDepth > 3) {
        info.complexity = FormulaComplexity::Complex;
    } else if (info.hasCrossSheet || info.referenceCount > 3 || info.nestingDepth > 1) {
        info.complexity = FormulaComplexity::Moderate;
    } else {
        info.complexity = FormulaComplexity::Simple;
    }
    info.canDrillDown = info.referenceCount > 0 && !info.hasExternal;
    return info;
}

}  // namespace finvar
