#pragma once

#include "analyzer.h"
#include "variance_engine.h"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>

namespace finvar {

// ============================================================================
// Drill-Down Cache
// ============================================================================

struct DrillDownKey {
    std::string sessionId;
    StatementType statementType = StatementType::IncomeStatement;
    std::string lineItemName;
    std::string period;

    bool operator<(const DrillDownKey& other) const {
        return std::tie(sessionId, statementType, lineItemName, period) <
               std::tie(other.sessionId, other.statementType, other.lineItemName, other.period);
    }
};

/**
 * @brief Thread-safe cache of drill-down results.
 *
 * Owned by the caller and passed to sessions explicitly. Entries are dropped
 * with invalidateSession/invalidateStatement when a sheet selection changes.
 */
class DrillDownCache {
public:
    std::shared_ptr<const DrillDownResult> find(const DrillDownKey& key) const;
    void store(const DrillDownKey& key, std::shared_ptr<const DrillDownResult> result);

    void invalidateSession(const std::string& sessionId);
    void invalidateStatement(const std::string& sessionId, StatementType type);
    void clear();

    size_t size() const;
    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }

private:
    mutable std::shared_mutex mutex_;
    std::map<DrillDownKey, std::shared_ptr<const DrillDownResult>> entries_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};

// ============================================================================
// Analysis Session
// ============================================================================

/**
 * @brief One comparison of two uploaded workbooks.
 *
 * Holds the current sheet and period selection. Structure is recomputed when
 * the sheets change, variances when the period changes; drill-downs are
 * computed lazily and cached.
 */
class AnalysisSession {
public:
    AnalysisSession(std::string id,
                    std::shared_ptr<const WorkbookModel> oldWorkbook,
                    std::shared_ptr<const WorkbookModel> newWorkbook,
                    DrillDownCache& cache,
                    const EngineOptions& options = EngineOptions());

    const std::string& id() const { return id_; }

    void setPeriodTemplates(const std::vector<PeriodTemplate>& templates);
    void selectSheets(const SheetSelection& selection);
    void selectSheets(const SheetSelection& oldSelection, const SheetSelection& newSelection);
    void selectPeriod(const std::string& period);

    const SheetSelection& oldSelection() const { return oldSelection_; }
    const SheetSelection& newSelection() const { return newSelection_; }
    const std::string& period() const { return period_; }

    // Suggested selection for the old workbook
    SheetSelection suggestSelection() const;

    // Current report, recomputed if the selection changed
    const AnalysisReport& report();

    // Drill-down for the selected period, served from the cache when present
    std::shared_ptr<const DrillDownResult> drillDown(StatementType type,
                                                     const std::string& lineItemName);

    const VarianceAnalyzer& analyzer() const { return analyzer_; }

private:
    std::string id_;
    VarianceAnalyzer analyzer_;
    DrillDownCache& cache_;
    SheetSelection oldSelection_;
    SheetSelection newSelection_;
    std::string period_;
    std::optional<AnalysisReport> report_;
};

}  // namespace finvar
