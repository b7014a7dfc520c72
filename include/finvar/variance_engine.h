#pragma once

#include "dependency_graph.h"
#include "diagnostics.h"
#include "matcher.h"
#include "options.h"
#include "workbook.h"
#include <optional>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Variance Result
// ============================================================================

struct VarianceResult {
    std::string lineItemName;
    std::optional<double> oldValue;
    std::optional<double> newValue;
    std::optional<double> absoluteVariance;
    std::optional<double> percentageVariance;
    bool percentageUndefined = false;  // old == 0: the percentage has no value
    double matchConfidence = 0.0;
    MatchKind matchKind = MatchKind::Exact;
    bool drillDownAvailable = false;
    bool significant = false;
};

// ============================================================================
// Drill-Down Result
// ============================================================================

enum class DrillDownStatus {
    Attributed,
    Failed
};

enum class DrillDownFailure {
    None,
    NoFormula,
    CircularReference,
    ParseError,
    Timeout,
    ItemNotFound,
    PeriodNotFound,
    MissingValue,
    ExternalLink,
    DepthExceeded
};

enum class DrillDownState {
    Requested,
    GraphBuilding,
    ComponentMatching,
    Attributed,
    Failed
};

std::string drillDownStatusToString(DrillDownStatus status);
std::string failureToString(DrillDownFailure failure);
std::string drillDownStateToString(DrillDownState state);

struct VarianceComponent {
    std::string name;                  // Operand text as written (old side preferred)
    std::string oldCellRef;            // Qualified address or name; empty if absent
    std::string newCellRef;
    std::optional<double> oldValue;
    std::optional<double> newValue;
    double varianceContribution = 0.0;
    std::optional<double> percentageVariance;   // Operand change relative to its old value
    bool percentageUndefined = false;           // Old operand value is 0
    std::optional<double> contributionToTotal;  // Share of the total variance; absent when it is 0
    double coefficient = 1.0;
    bool isLeaf = true;
    bool hasFormula = false;
    bool asymmetric = false;           // Present on one side only
    ModelSide side = ModelSide::None;  // Side holding the operand when asymmetric
};

struct DrillDownResult {
    DrillDownStatus status = DrillDownStatus::Failed;
    DrillDownFailure failureReason = DrillDownFailure::None;
    std::string message;
    std::string lineItemName;
    std::string period;
    std::optional<double> sourceValueOld;
    std::optional<double> sourceValueNew;
    double totalVariance = 0.0;
    double totalExplained = 0.0;
    double unexplainedVariance = 0.0;
    std::string oldFormula;
    std::string newFormula;
    std::vector<VarianceComponent> components;
    std::vector<DrillDownState> states;
    std::vector<Finding> findings;

    bool success() const { return status == DrillDownStatus::Attributed; }
};

// ============================================================================
// Variance Engine
// ============================================================================

class VarianceEngine {
public:
    explicit VarianceEngine(const EngineOptions& options = EngineOptions());

    // Top-level variance for one matched pair at one period
    VarianceResult computeVariance(const MatchedPair& pair,
                                   const std::string& oldPeriodLabel,
                                   const std::string& newPeriodLabel) const;

    VarianceResult computeVariance(const MatchedPair& pair, const std::string& periodLabel) const {
        return computeVariance(pair, periodLabel, periodLabel);
    }

    // Variance arithmetic on raw values
    void fillVariance(VarianceResult& result) const;

    /**
     * @brief Attribute the variance of one cell pair to its formula operands.
     *
     * The cells are the period cells of a matched line item in each workbook.
     * States traverse Requested -> GraphBuilding -> ComponentMatching ->
     * Attributed | Failed.
     *
     * Both graphs share one deadline: the given one, or drillDownTimeoutMs
     * from the start of the call.
     */
    DrillDownResult drillDown(const WorkbookModel& oldWorkbook, const Cell& oldCell,
                              const WorkbookModel& newWorkbook, const Cell& newCell,
                              std::optional<DependencyGraphBuilder::Clock::time_point> deadline =
                                  std::nullopt) const;

private:
    EngineOptions options_;
};

}  // namespace finvar
