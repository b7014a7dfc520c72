#pragma once

#include "diagnostics.h"
#include "formula_parser.h"
#include "options.h"
#include "workbook.h"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Evaluable Capability
// ============================================================================

// Anything the variance engine can attribute to: formula cells, constants,
// and opaque leaves standing in for unsupported constructs.
class Evaluable {
public:
    virtual ~Evaluable() = default;
    virtual std::optional<double> resolvedValue() const = 0;
    virtual bool isLeaf() const = 0;
};

// ============================================================================
// Formula Node
// ============================================================================

enum class NodeKind {
    Constant,      // Numeric or text value without formula
    Blank,         // Never-written or empty cell (resolves to 0)
    Formula,       // Parsed formula with children
    Opaque,        // Formula that failed to parse
    External,      // Formula referencing another workbook
    Truncated,     // Beyond the depth bound
    MissingSheet,  // Reference to a sheet that does not exist
    Name           // Defined name that does not resolve to a cell
};

std::string nodeKindToString(NodeKind kind);

class FormulaNode : public Evaluable {
public:
    std::string key;                   // Qualified address "Sheet!C14"
    std::string sheet;
    int row = 0;
    int col = 0;
    NodeKind kind = NodeKind::Constant;
    std::optional<std::string> expression;
    std::vector<Operand> operands;
    std::vector<std::vector<std::string>> operandCells;  // Node keys per operand
    std::optional<double> value;
    int depth = 0;

    bool leaf = true;
    bool truncated = false;
    bool parseWarning = false;
    bool circular = false;

    std::optional<double> resolvedValue() const override { return value; }
    bool isLeaf() const override { return leaf; }
    bool isExternal() const { return kind == NodeKind::External; }
    bool hasFormula() const { return expression.has_value(); }
};

// ============================================================================
// Dependency Graph
// ============================================================================

enum class GraphStatus {
    Complete,
    CycleDetected,
    TimedOut,
    Failed
};

std::string graphStatusToString(GraphStatus status);

class DependencyGraph {
public:
    GraphStatus status = GraphStatus::Complete;
    std::string rootKey;
    int maxDepthReached = 0;
    bool truncated = false;
    std::vector<Finding> findings;

    const FormulaNode* root() const { return node(rootKey); }
    const FormulaNode* node(const std::string& key) const;
    size_t nodeCount() const { return nodes_.size(); }
    const std::map<std::string, std::unique_ptr<FormulaNode>>& nodes() const { return nodes_; }

    // Leaf keys reachable from the root, in depth-first operand order
    std::vector<std::string> leaves() const;

private:
    friend class DependencyGraphBuilder;
    std::map<std::string, std::unique_ptr<FormulaNode>> nodes_;
};

// ============================================================================
// Builder
// ============================================================================

/**
 * @brief Depth-first construction of the dependency graph under a cell.
 *
 * Bounded by options.maxGraphDepth, maxGraphNodes, maxRangeCells and a
 * drillDownTimeoutMs deadline. Cycles are recorded on the node where the walk
 * re-entered a cell still being visited.
 */
class DependencyGraphBuilder {
public:
    using Clock = std::chrono::steady_clock;

    DependencyGraphBuilder(const WorkbookModel& workbook, const EngineOptions& options,
                           ModelSide side = ModelSide::None);

    // Deadline starts now, drillDownTimeoutMs from options (0 = none)
    DependencyGraph build(const std::string& sheet, int row, int col);

    // Deadline owned by the caller, shared by every graph of one request
    DependencyGraph build(const std::string& sheet, int row, int col,
                          std::optional<Clock::time_point> deadline);

    // Parse of the root formula from the last build()
    const FormulaParseResult& rootParse() const { return rootParse_; }

private:
    const WorkbookModel& workbook_;
    EngineOptions options_;
    ModelSide side_;
    FormulaParser parser_;
    FormulaParseResult rootParse_;

    DependencyGraph* graph_ = nullptr;
    std::map<std::string, bool> visiting_;
    Clock::time_point deadline_;
    bool hasDeadline_ = false;
    bool stopped_ = false;

    FormulaNode* visit(const std::string& sheet, int row, int col, int depth);
    std::vector<std::string> resolveOperand(const Operand& operand, const std::string& currentSheet,
                                            FormulaNode& owner, int depth);
    bool deadlineExceeded();
    void addFinding(ErrorCategory category, Severity severity, const std::string& code,
                    const std::string& message, const std::string& sheet, int row, int col);
};

}  // namespace finvar
