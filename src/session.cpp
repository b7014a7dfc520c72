#include "finvar/session.h"
#include <iostream>
#include <mutex>

namespace finvar {

// ============================================================================
// Drill-Down Cache
// ============================================================================

std::shared_ptr<const DrillDownResult> DrillDownCache::find(const DrillDownKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return nullptr;
    }
    ++hits_;
    return it->second;
}

void DrillDownCache::store(const DrillDownKey& key, std::shared_ptr<const DrillDownResult> result) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = std::move(result);
}

void DrillDownCache::invalidateSession(const std::string& sessionId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.sessionId == sessionId) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void DrillDownCache::invalidateStatement(const std::string& sessionId, StatementType type) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.sessionId == sessionId && it->first.statementType == type) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void DrillDownCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

size_t DrillDownCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// Analysis Session
// ============================================================================

AnalysisSession::AnalysisSession(std::string id,
                                 std::shared_ptr<const WorkbookModel> oldWorkbook,
                                 std::shared_ptr<const WorkbookModel> newWorkbook,
                                 DrillDownCache& cache,
                                 const EngineOptions& options)
    : id_(std::move(id)),
      analyzer_(std::move(oldWorkbook), std::move(newWorkbook), options),
      cache_(cache) {}

void AnalysisSession::setPeriodTemplates(const std::vector<PeriodTemplate>& templates) {
    analyzer_.setPeriodTemplates(templates);
    report_.reset();
    cache_.invalidateSession(id_);
}

void AnalysisSession::selectSheets(const SheetSelection& selection) {
    selectSheets(selection, selection);
}

void AnalysisSession::selectSheets(const SheetSelection& oldSelection, const SheetSelection& newSelection) {
    // Only statements whose mapping changed lose their drill-downs
    for (StatementType type : {StatementType::IncomeStatement, StatementType::BalanceSheet,
                               StatementType::CashFlow}) {
        auto sheetFor = [type](const SheetSelection& s) {
            auto it = s.find(type);
            return it == s.end() ? std::string() : it->second;
        };
        if (sheetFor(oldSelection) != sheetFor(oldSelection_) ||
            sheetFor(newSelection) != sheetFor(newSelection_)) {
            cache_.invalidateStatement(id_, type);
        }
    }
    oldSelection_ = oldSelection;
    newSelection_ = newSelection;
    report_.reset();
}

void AnalysisSession::selectPeriod(const std::string& period) {
    // Cached drill-downs are keyed by period and stay valid
    if (period != period_) {
        period_ = period;
        report_.reset();
    }
}

SheetSelection AnalysisSession::suggestSelection() const {
    return suggestSheetSelection(analyzer_.oldWorkbook());
}

const AnalysisReport& AnalysisSession::report() {
    if (!report_) {
        report_ = analyzer_.analyze(oldSelection_, newSelection_, period_);
        if (analyzer_.options().verbose) {
            std::cerr << "[session] " << id_ << ": report for period '" << report_->period << "'\n";
        }
    }
    return *report_;
}

std::shared_ptr<const DrillDownResult> AnalysisSession::drillDown(StatementType type,
                                                                  const std::string& lineItemName) {
    const AnalysisReport& current = report();
    const StatementAnalysis* statement = current.statement(type);

    DrillDownKey key;
    key.sessionId = id_;
    key.statementType = type;
    key.lineItemName = lineItemName;
    key.period = statement ? statement->period : current.period;

    if (auto cached = cache_.find(key)) {
        return cached;
    }

    auto result = std::make_shared<DrillDownResult>();
    if (!statement || !statement->success) {
        result->lineItemName = lineItemName;
        result->period = current.period;
        result->states = {DrillDownState::Requested, DrillDownState::Failed};
        result->failureReason = DrillDownFailure::ItemNotFound;
        result->message = statementTypeToString(type) + " was not analysed";
    } else {
        *result = analyzer_.drillDown(*statement, lineItemName);
    }

    cache_.store(key, result);
    return result;
}

}  // namespace finvar
