#include "finvar/variance_engine.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace finvar {

std::string drillDownStatusToString(DrillDownStatus status) {
    switch (status) {
        case DrillDownStatus::Attributed: return "Attributed";
        case DrillDownStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::string failureToString(DrillDownFailure failure) {
    switch (failure) {
        case DrillDownFailure::None: return "None";
        case DrillDownFailure::NoFormula: return "NoFormula";
        case DrillDownFailure::CircularReference: return "CircularReference";
        case DrillDownFailure::ParseError: return "ParseError";
        case DrillDownFailure::Timeout: return "Timeout";
        case DrillDownFailure::ItemNotFound: return "ItemNotFound";
        case DrillDownFailure::PeriodNotFound: return "PeriodNotFound";
        case DrillDownFailure::MissingValue: return "MissingValue";
        case DrillDownFailure::ExternalLink: return "ExternalLink";
        case DrillDownFailure::DepthExceeded: return "DepthExceeded";
        default: return "Unknown";
    }
}

std::string drillDownStateToString(DrillDownState state) {
    switch (state) {
        case DrillDownState::Requested: return "Requested";
        case DrillDownState::GraphBuilding: return "GraphBuilding";
        case DrillDownState::ComponentMatching: return "ComponentMatching";
        case DrillDownState::Attributed: return "Attributed";
        case DrillDownState::Failed: return "Failed";
        default: return "Unknown";
    }
}

VarianceEngine::VarianceEngine(const EngineOptions& options) : options_(options) {}

// ============================================================================
// Top-level variance
// ============================================================================

void VarianceEngine::fillVariance(VarianceResult& result) const {
    result.absoluteVariance.reset();
    result.percentageVariance.reset();
    result.percentageUndefined = false;
    result.significant = false;

    if (!result.oldValue || !result.newValue) {
        return;
    }

    double oldValue = *result.oldValue;
    double absolute = *result.newValue - oldValue;
    result.absoluteVariance = absolute;

    if (oldValue == 0.0) {
        result.percentageUndefined = true;
        result.significant = absolute != 0.0;
    } else {
        double pct = absolute / std::fabs(oldValue) * 100.0;
        result.percentageVariance = pct;
        result.significant = std::fabs(pct) >= options_.varianceThreshold * 100.0;
    }
}

VarianceResult VarianceEngine::computeVariance(const MatchedPair& pair,
                                               const std::string& oldPeriodLabel,
                                               const std::string& newPeriodLabel) const {
    VarianceResult result;
    result.lineItemName = pair.displayName();
    result.matchConfidence = pair.confidence;
    result.matchKind = pair.kind;

    if (pair.oldItem) result.oldValue = pair.oldItem->value(oldPeriodLabel);
    if (pair.newItem) result.newValue = pair.newItem->value(newPeriodLabel);

    fillVariance(result);

    bool hasFormula = (pair.oldItem && pair.oldItem->hasFormula(oldPeriodLabel)) ||
                      (pair.newItem && pair.newItem->hasFormula(newPeriodLabel));
    result.drillDownAvailable = result.oldValue.has_value() && result.newValue.has_value() && hasFormula;
    return result;
}

// ============================================================================
// Drill-down
// ============================================================================

namespace {

struct FlatOperand {
    std::string name;
    std::string key;
    double coefficient = 1.0;
};

// Root operands with ranges flattened to one entry per cell
std::vector<FlatOperand> flattenRoot(const DependencyGraph& graph) {
    std::vector<FlatOperand> flat;
    const FormulaNode* root = graph.root();
    if (!root || root->kind != NodeKind::Formula) return flat;

    for (size_t i = 0; i < root->operands.size() && i < root->operandCells.size(); ++i) {
        const Operand& op = root->operands[i];
        bool range = op.reference && op.reference->isRange;
        for (const auto& key : root->operandCells[i]) {
            FlatOperand f;
            f.name = range ? key : op.text();
            f.key = key;
            f.coefficient = op.coefficient;
            flat.push_back(f);
        }
    }
    return flat;
}

void appendFindings(std::vector<Finding>& to, const std::vector<Finding>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

}  // namespace

DrillDownResult VarianceEngine::drillDown(const WorkbookModel& oldWorkbook, const Cell& oldCell,
                                          const WorkbookModel& newWorkbook, const Cell& newCell,
                                          std::optional<DependencyGraphBuilder::Clock::time_point> deadline) const {
    if (!deadline && options_.drillDownTimeoutMs > 0) {
        deadline = DependencyGraphBuilder::Clock::now() +
                   std::chrono::milliseconds(options_.drillDownTimeoutMs);
    }

    DrillDownResult result;
    result.states.push_back(DrillDownState::Requested);
    result.sourceValueOld = oldCell.numericValue();
    result.sourceValueNew = newCell.numericValue();
    if (oldCell.hasFormula()) result.oldFormula = *oldCell.formula;
    if (newCell.hasFormula()) result.newFormula = *newCell.formula;

    auto fail = [&result](DrillDownFailure reason, const std::string& message) {
        result.status = DrillDownStatus::Failed;
        result.failureReason = reason;
        result.message = message;
        result.states.push_back(DrillDownState::Failed);
        return result;
    };

    if (!result.sourceValueOld || !result.sourceValueNew) {
        return fail(DrillDownFailure::MissingValue,
                    "Both models need a numeric value at " + oldCell.qualifiedAddress() +
                    " / " + newCell.qualifiedAddress());
    }
    if (!oldCell.hasFormula() && !newCell.hasFormula()) {
        return fail(DrillDownFailure::NoFormula, "Neither cell holds a formula; the values are inputs");
    }
    result.totalVariance = *result.sourceValueNew - *result.sourceValueOld;

    // Graph building
    result.states.push_back(DrillDownState::GraphBuilding);
    DependencyGraphBuilder oldBuilder(oldWorkbook, options_, ModelSide::Old);
    DependencyGraphBuilder newBuilder(newWorkbook, options_, ModelSide::New);
    DependencyGraph oldGraph = oldBuilder.build(oldCell.sheet, oldCell.row, oldCell.col, deadline);
    DependencyGraph newGraph = newBuilder.build(newCell.sheet, newCell.row, newCell.col, deadline);
    appendFindings(result.findings, oldGraph.findings);
    appendFindings(result.findings, newGraph.findings);

    if (oldGraph.status == GraphStatus::TimedOut || newGraph.status == GraphStatus::TimedOut) {
        return fail(DrillDownFailure::Timeout,
                    "Dependency graphs exceeded the drill-down deadline of " +
                    std::to_string(options_.drillDownTimeoutMs) + " ms");
    }

    for (const auto* graph : {&oldGraph, &newGraph}) {
        const FormulaNode* root = graph->root();
        if (!root) continue;
        if (root->kind == NodeKind::Opaque) {
            const auto& parse = graph == &oldGraph ? oldBuilder.rootParse() : newBuilder.rootParse();
            return fail(DrillDownFailure::ParseError,
                        "Could not parse " + root->expression.value_or("") + ": " + parse.errorMessage);
        }
        if (root->kind == NodeKind::External) {
            return fail(DrillDownFailure::ExternalLink,
                        root->key + " links to another workbook; its inputs are not available");
        }
    }

    if (oldGraph.status == GraphStatus::CycleDetected || newGraph.status == GraphStatus::CycleDetected) {
        return fail(DrillDownFailure::CircularReference, "Circular reference in the dependency graph");
    }
    if (options_.failOnDepthExceeded && (oldGraph.truncated || newGraph.truncated)) {
        return fail(DrillDownFailure::DepthExceeded, "Dependency graph exceeded its depth or size bounds");
    }

    // Component matching by operand position
    result.states.push_back(DrillDownState::ComponentMatching);
    auto oldOperands = flattenRoot(oldGraph);
    auto newOperands = flattenRoot(newGraph);
    size_t count = std::max(oldOperands.size(), newOperands.size());

    for (size_t i = 0; i < count; ++i) {
        VarianceComponent comp;
        const FlatOperand* o = i < oldOperands.size() ? &oldOperands[i] : nullptr;
        const FlatOperand* n = i < newOperands.size() ? &newOperands[i] : nullptr;
        const FormulaNode* oldNode = o ? oldGraph.node(o->key) : nullptr;
        const FormulaNode* newNode = n ? newGraph.node(n->key) : nullptr;

        comp.name = o ? o->name : n->name;
        comp.coefficient = o ? o->coefficient : n->coefficient;
        if (o) comp.oldCellRef = o->key;
        if (n) comp.newCellRef = n->key;
        if (oldNode) comp.oldValue = oldNode->resolvedValue();
        if (newNode) comp.newValue = newNode->resolvedValue();

        const FormulaNode* shown = newNode ? newNode : oldNode;
        if (shown) {
            comp.isLeaf = shown->isLeaf();
            comp.hasFormula = shown->hasFormula();
        }

        // A side without the operand contributes 0
        double oldTerm = o ? o->coefficient * comp.oldValue.value_or(0.0) : 0.0;
        double newTerm = n ? n->coefficient * comp.newValue.value_or(0.0) : 0.0;
        comp.varianceContribution = newTerm - oldTerm;

        if (!o || !n) {
            comp.asymmetric = true;
            comp.side = o ? ModelSide::Old : ModelSide::New;
        } else if (comp.oldValue && comp.newValue) {
            if (*comp.oldValue == 0.0) {
                comp.percentageUndefined = true;
            } else {
                comp.percentageVariance = (*comp.newValue - *comp.oldValue) / std::fabs(*comp.oldValue) * 100.0;
            }
        }
        if (result.totalVariance != 0.0) {
            comp.contributionToTotal = comp.varianceContribution / result.totalVariance;
        }

        result.totalExplained += comp.varianceContribution;
        result.components.push_back(comp);
    }

    result.unexplainedVariance = result.totalVariance - result.totalExplained;
    result.status = DrillDownStatus::Attributed;
    result.states.push_back(DrillDownState::Attributed);

    if (options_.verbose) {
        std::cerr << "[drilldown] " << oldCell.qualifiedAddress() << ": " << result.components.size()
                  << " components, explained " << result.totalExplained << " of " << result.totalVariance << "\n";
    }
    return result;
}

}  // namespace finvar
