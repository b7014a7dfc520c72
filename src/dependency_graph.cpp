#include "finvar/dependency_graph.h"
#include <algorithm>
#include <iostream>
#include <set>

namespace finvar {

std::string nodeKindToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Constant: return "constant";
        case NodeKind::Blank: return "blank";
        case NodeKind::Formula: return "formula";
        case NodeKind::Opaque: return "opaque";
        case NodeKind::External: return "external";
        case NodeKind::Truncated: return "truncated";
        case NodeKind::MissingSheet: return "missing_sheet";
        case NodeKind::Name: return "name";
        default: return "unknown";
    }
}

std::string graphStatusToString(GraphStatus status) {
    switch (status) {
        case GraphStatus::Complete: return "Complete";
        case GraphStatus::CycleDetected: return "CycleDetected";
        case GraphStatus::TimedOut: return "TimedOut";
        case GraphStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

// ============================================================================
// Dependency Graph
// ============================================================================

const FormulaNode* DependencyGraph::node(const std::string& key) const {
    auto it = nodes_.find(key);
    return it == nodes_.end() ? nullptr : it->second.get();
}

std::vector<std::string> DependencyGraph::leaves() const {
    std::vector<std::string> result;
    std::set<std::string> seen;
    std::vector<std::string> stack;
    if (node(rootKey)) stack.push_back(rootKey);

    // Iterative DFS; children pushed in reverse to keep operand order
    while (!stack.empty()) {
        std::string key = stack.back();
        stack.pop_back();
        if (!seen.insert(key).second) continue;
        const FormulaNode* n = node(key);
        if (!n) continue;
        if (n->isLeaf()) {
            result.push_back(key);
            continue;
        }
        for (auto it = n->operandCells.rbegin(); it != n->operandCells.rend(); ++it) {
            for (auto k = it->rbegin(); k != it->rend(); ++k) {
                if (!seen.count(*k)) stack.push_back(*k);
            }
        }
    }
    return result;
}

// ============================================================================
// Builder
// ============================================================================

DependencyGraphBuilder::DependencyGraphBuilder(const WorkbookModel& workbook,
                                               const EngineOptions& options,
                                               ModelSide side)
    : workbook_(workbook), options_(options), side_(side) {}

void DependencyGraphBuilder::addFinding(ErrorCategory category, Severity severity,
                                        const std::string& code, const std::string& message,
                                        const std::string& sheet, int row, int col) {
    SourceLocation loc;
    loc.side = side_;
    loc.sheet = sheet;
    loc.row = row;
    loc.col = col;
    graph_->findings.push_back(makeFinding(category, severity, code, message, loc));
}

bool DependencyGraphBuilder::deadlineExceeded() {
    if (stopped_) return true;
    if (hasDeadline_ && Clock::now() > deadline_) {
        stopped_ = true;
    }
    return stopped_;
}

DependencyGraph DependencyGraphBuilder::build(const std::string& sheet, int row, int col) {
    std::optional<Clock::time_point> deadline;
    if (options_.drillDownTimeoutMs > 0) {
        deadline = Clock::now() + std::chrono::milliseconds(options_.drillDownTimeoutMs);
    }
    return build(sheet, row, col, deadline);
}

DependencyGraph DependencyGraphBuilder::build(const std::string& sheet, int row, int col,
                                              std::optional<Clock::time_point> deadline) {
    DependencyGraph graph;
    graph_ = &graph;
    visiting_.clear();
    stopped_ = false;
    rootParse_ = FormulaParseResult();
    hasDeadline_ = deadline.has_value();
    if (hasDeadline_) {
        deadline_ = *deadline;
    }

    const Sheet* s = workbook_.sheet(sheet);
    graph.rootKey = (s ? s->name() : sheet) + "!" + cellAddress(row, col);

    visit(sheet, row, col, 0);

    if (stopped_) {
        graph.status = GraphStatus::TimedOut;
        addFinding(ErrorCategory::GraphError, Severity::Warning, "DrillDownTimeout",
                   "Dependency graph construction passed its deadline after " +
                   std::to_string(graph.nodeCount()) + " nodes",
                   sheet, row, col);
    } else {
        bool cycle = std::any_of(graph.nodes_.begin(), graph.nodes_.end(),
                                 [](const auto& kv) { return kv.second->circular; });
        graph.status = cycle ? GraphStatus::CycleDetected : GraphStatus::Complete;
    }

    if (options_.verbose) {
        std::cerr << "[graph] " << graph.rootKey << ": " << graph.nodeCount() << " nodes, depth "
                  << graph.maxDepthReached << ", " << graphStatusToString(graph.status) << "\n";
    }

    graph_ = nullptr;
    return graph;
}

FormulaNode* DependencyGraphBuilder::visit(const std::string& sheetName, int row, int col, int depth) {
    const Sheet* sheet = workbook_.sheet(sheetName);
    std::string canonicalSheet = sheet ? sheet->name() : sheetName;
    std::string key = canonicalSheet + "!" + cellAddress(row, col);

    auto existing = graph_->nodes_.find(key);
    if (existing != graph_->nodes_.end()) {
        FormulaNode* n = existing->second.get();
        if (visiting_.count(key)) {
            if (!n->circular) {
                n->circular = true;
                addFinding(ErrorCategory::GraphError, Severity::Warning, "CircularReferenceDetected",
                           "Circular reference through " + key, canonicalSheet, row, col);
            }
        }
        return n;
    }

    if (deadlineExceeded()) {
        return nullptr;
    }

    auto owned = std::make_unique<FormulaNode>();
    FormulaNode* node = owned.get();
    node->key = key;
    node->sheet = canonicalSheet;
    node->row = row;
    node->col = col;
    node->depth = depth;
    graph_->nodes_.emplace(key, std::move(owned));
    graph_->maxDepthReached = std::max(graph_->maxDepthReached, depth);

    if (!sheet) {
        node->kind = NodeKind::MissingSheet;
        addFinding(ErrorCategory::FormulaError, Severity::Warning, "MissingSheet",
                   "Reference to sheet '" + sheetName + "' which does not exist", sheetName, row, col);
        return node;
    }

    const Cell* cell = sheet->cell(row, col);
    if (!cell || (!cell->hasFormula() && isEmptyValue(cell->rawValue))) {
        node->kind = NodeKind::Blank;
        node->value = 0.0;
        return node;
    }

    if (!cell->hasFormula()) {
        node->kind = NodeKind::Constant;
        node->value = cell->numericValue();
        if (!node->value) {
            addFinding(ErrorCategory::DataError, Severity::Warning, "NonNumericValue",
                       "Cell holds '" + valueToString(cell->rawValue) + "' where a number was expected",
                       canonicalSheet, row, col);
        }
        return node;
    }

    node->expression = *cell->formula;
    node->value = cell->numericValue();

    if (depth > options_.maxGraphDepth) {
        node->kind = NodeKind::Truncated;
        node->truncated = true;
        graph_->truncated = true;
        addFinding(ErrorCategory::GraphError, Severity::Warning, "DepthLimitExceeded",
                   "Formula below depth " + std::to_string(options_.maxGraphDepth) + " treated as a leaf",
                   canonicalSheet, row, col);
        return node;
    }
    if (static_cast<int>(graph_->nodes_.size()) > options_.maxGraphNodes) {
        node->kind = NodeKind::Truncated;
        node->truncated = true;
        graph_->truncated = true;
        addFinding(ErrorCategory::GraphError, Severity::Warning, "NodeLimitExceeded",
                   "Graph exceeded " + std::to_string(options_.maxGraphNodes) + " nodes; formula treated as a leaf",
                   canonicalSheet, row, col);
        return node;
    }

    FormulaParseResult parsed = parser_.parse(*cell->formula);
    if (depth == 0) {
        rootParse_ = parsed;
    }

    if (!parsed.success) {
        node->kind = NodeKind::Opaque;
        node->parseWarning = true;
        addFinding(ErrorCategory::FormulaError, Severity::Warning, "FormulaParseError",
                   "Could not parse " + *cell->formula + ": " + parsed.errorMessage,
                   canonicalSheet, row, col);
        return node;
    }

    node->operands = parsed.operands;
    if (parsed.hasExternalReference) {
        node->kind = NodeKind::External;
        addFinding(ErrorCategory::FormulaError, Severity::Info, "ExternalReference",
                   "Formula links to another workbook; cached value used", canonicalSheet, row, col);
        return node;
    }

    node->kind = NodeKind::Formula;
    node->leaf = false;

    visiting_[key] = true;
    for (const auto& operand : node->operands) {
        node->operandCells.push_back(resolveOperand(operand, canonicalSheet, *node, depth));
        if (stopped_) break;
    }
    visiting_.erase(key);
    return node;
}

std::vector<std::string> DependencyGraphBuilder::resolveOperand(const Operand& operand,
                                                                const std::string& currentSheet,
                                                                FormulaNode& owner, int depth) {
    std::vector<std::string> keys;

    std::optional<Reference> ref = operand.reference;
    if (!ref) {
        auto target = workbook_.definedName(operand.name);
        if (target) {
            ref = parseReferenceToken(*target);
        }
        if (!ref) {
            std::string key = "name:" + operand.name;
            if (!graph_->nodes_.count(key)) {
                auto n = std::make_unique<FormulaNode>();
                n->key = key;
                n->kind = NodeKind::Name;
                n->depth = depth + 1;
                graph_->nodes_.emplace(key, std::move(n));
                addFinding(ErrorCategory::FormulaError, Severity::Warning, "UnresolvedName",
                           "Name '" + operand.name + "' does not resolve to a cell reference",
                           owner.sheet, owner.row, owner.col);
            }
            keys.push_back(key);
            return keys;
        }
    }

    if (ref->isExternal()) {
        std::string key = "[" + *ref->workbook + "]" + ref->text;
        if (!graph_->nodes_.count(key)) {
            auto n = std::make_unique<FormulaNode>();
            n->key = key;
            n->kind = NodeKind::External;
            n->depth = depth + 1;
            graph_->nodes_.emplace(key, std::move(n));
        }
        keys.push_back(key);
        return keys;
    }

    std::string sheetName = ref->sheet ? *ref->sheet : currentSheet;
    const Sheet* sheet = workbook_.sheet(sheetName);

    if (!ref->isRange) {
        if (FormulaNode* child = visit(sheetName, ref->start.row, ref->start.col, depth + 1)) {
            keys.push_back(child->key);
        }
        return keys;
    }

    if (!sheet) {
        int row = std::max(ref->start.row, 1);
        int col = std::max(ref->start.col, 1);
        if (FormulaNode* child = visit(sheetName, row, col, depth + 1)) {
            keys.push_back(child->key);
        }
        return keys;
    }

    int row1 = ref->start.row > 0 ? ref->start.row : 1;
    int row2 = ref->end.row > 0 ? ref->end.row : sheet->maxRow();
    int col1 = ref->start.col > 0 ? ref->start.col : 1;
    int col2 = ref->end.col > 0 ? ref->end.col : sheet->maxColumn();
    if (row1 > row2) std::swap(row1, row2);
    if (col1 > col2) std::swap(col1, col2);

    long long area = static_cast<long long>(row2 - row1 + 1) * static_cast<long long>(col2 - col1 + 1);
    bool wholeLines = ref->start.row == 0 || ref->start.col == 0;

    if (!wholeLines && area <= options_.maxRangeCells) {
        // Dense expansion keeps operand positions stable across models
        for (int r = row1; r <= row2 && !stopped_; ++r) {
            for (int c = col1; c <= col2 && !stopped_; ++c) {
                if (FormulaNode* child = visit(sheetName, r, c, depth + 1)) {
                    keys.push_back(child->key);
                }
            }
        }
        return keys;
    }

    // Whole columns/rows and oversized ranges: populated cells only, capped
    int taken = 0;
    for (const auto& [rc, cell] : sheet->cells()) {
        if (stopped_) break;
        if (rc.first < row1 || rc.first > row2 || rc.second < col1 || rc.second > col2) continue;
        if (taken >= options_.maxRangeCells) {
            graph_->truncated = true;
            addFinding(ErrorCategory::GraphError, Severity::Warning, "RangeLimitExceeded",
                       "Range " + ref->text + " expanded to the first " +
                       std::to_string(options_.maxRangeCells) + " populated cells",
                       owner.sheet, owner.row, owner.col);
            break;
        }
        if (FormulaNode* child = visit(sheetName, rc.first, rc.second, depth + 1)) {
            keys.push_back(child->key);
        }
        ++taken;
    }
    return keys;
}

}  // namespace finvar
