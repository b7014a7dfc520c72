#include "finvar/analyzer.h"
#include "finvar/thread_pool.h"
#include <chrono>
#include <future>
#include <iostream>
#include <map>
#include <set>

namespace finvar {

// ============================================================================
// Result lookups
// ============================================================================

const MatchedPair* StatementAnalysis::findPair(const std::string& lineItemName) const {
    for (const auto& pair : match.pairs) {
        if (pair.displayName() == lineItemName) return &pair;
    }
    // The new-side label of a fuzzy pair also identifies it
    for (const auto& pair : match.pairs) {
        if (pair.newItem && pair.newItem->name == lineItemName) return &pair;
    }
    return nullptr;
}

const StatementAnalysis* AnalysisReport::statement(StatementType type) const {
    for (const auto& s : statements) {
        if (s.statementType == type) return &s;
    }
    return nullptr;
}

namespace {

void tagSide(std::vector<Finding>& findings, ModelSide side) {
    for (auto& f : findings) {
        if (f.location.side == ModelSide::None) f.location.side = side;
    }
}

void append(std::vector<Finding>& to, const std::vector<Finding>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

}  // namespace

// ============================================================================
// Variance Analyzer
// ============================================================================

VarianceAnalyzer::VarianceAnalyzer(std::shared_ptr<const WorkbookModel> oldWorkbook,
                                   std::shared_ptr<const WorkbookModel> newWorkbook,
                                   const EngineOptions& options)
    : oldWorkbook_(std::move(oldWorkbook)), newWorkbook_(std::move(newWorkbook)), options_(options) {}

SheetStructure VarianceAnalyzer::probeSheet(ModelSide side, const std::string& sheetName,
                                            StatementType type) const {
    SheetStructure structure;
    structure.side = side;
    structure.statementType = type;
    structure.sheet = sheetName;

    const WorkbookModel* workbook = side == ModelSide::New ? newWorkbook_.get() : oldWorkbook_.get();
    SourceLocation loc;
    loc.side = side;
    loc.sheet = sheetName;

    if (!workbook) {
        structure.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Fatal,
            "WorkbookMissing", "No workbook loaded for this side", loc));
        return structure;
    }

    const Sheet* sheet = workbook->sheet(sheetName);
    if (!sheet) {
        structure.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Fatal,
            "SheetNotFound", "Sheet '" + sheetName + "' selected as " + statementTypeToString(type) +
            " does not exist in workbook '" + workbook->name() + "'", loc));
        return structure;
    }
    structure.sheet = sheet->name();

    try {
        PeriodDetector detector(options_);
        detector.addTemplates(templates_);
        structure.periods = detector.detect(*sheet);
        append(structure.findings, structure.periods.findings);

        if (structure.periods.success) {
            LineItemExtractor extractor(options_);
            structure.extraction = extractor.extract(*sheet, structure.periods, type);
            append(structure.findings, structure.extraction.findings);
            structure.success = true;

            std::vector<std::string> labels;
            for (const auto& p : structure.periods.periods) labels.push_back(p.label);
            structure.templateSuggestions = suggestTemplatesFromSamples(labels);
        }
    } catch (const std::exception& e) {
        structure.success = false;
        structure.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Fatal,
            "InternalError", std::string("Structure detection failed: ") + e.what(), loc));
    }

    tagSide(structure.findings, side);

    if (options_.verbose) {
        std::cerr << "[probe] " << sideToString(side) << " " << structure.sheet << ": "
                  << structure.periods.periods.size() << " periods at row " << structure.periods.headerRow
                  << ", " << structure.extraction.items.size() << " line items\n";
    }
    return structure;
}

AnalysisReport VarianceAnalyzer::analyze(const SheetSelection& selection, const std::string& period) const {
    return analyze(selection, selection, period);
}

AnalysisReport VarianceAnalyzer::analyze(const SheetSelection& oldSelection,
                                         const SheetSelection& newSelection,
                                         const std::string& period) const {
    AnalysisReport report;
    report.period = period;

    auto pipeline_start = std::chrono::high_resolution_clock::now();

    std::set<StatementType> types;
    for (const auto& [type, sheet] : oldSelection) types.insert(type);
    for (const auto& [type, sheet] : newSelection) types.insert(type);

    if (types.empty()) {
        report.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Warning,
            "EmptySelection", "No statement type was mapped to a sheet"));
        return report;
    }

    try {
        ThreadPool pool(options_.threads);

        // Stage 1: structure detection per (statement type, side)
        auto t1 = std::chrono::high_resolution_clock::now();
        std::map<StatementType, std::pair<std::future<SheetStructure>, std::future<SheetStructure>>> probes;
        for (StatementType type : types) {
            auto probe = [this, type](ModelSide side, const SheetSelection& selection) {
                auto it = selection.find(type);
                if (it == selection.end()) {
                    SheetStructure missing;
                    missing.side = side;
                    missing.statementType = type;
                    SourceLocation loc;
                    loc.side = side;
                    missing.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Fatal,
                        "SheetNotFound", "No sheet selected for " + statementTypeToString(type), loc));
                    return missing;
                }
                return probeSheet(side, it->second, type);
            };
            probes[type] = std::make_pair(
                pool.submit([probe, &oldSelection] { return probe(ModelSide::Old, oldSelection); }),
                pool.submit([probe, &newSelection] { return probe(ModelSide::New, newSelection); }));
        }

        std::map<StatementType, std::pair<SheetStructure, SheetStructure>> structures;
        for (auto& [type, futures] : probes) {
            structures[type] = std::make_pair(futures.first.get(), futures.second.get());
        }
        auto t2 = std::chrono::high_resolution_clock::now();
        report.timing.detect_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

        // Stage 2: matching, one task per statement type
        t1 = std::chrono::high_resolution_clock::now();
        std::vector<std::future<StatementAnalysis>> matches;
        for (auto& [type, pair] : structures) {
            matches.push_back(pool.submit(
                [this, type = type, period, o = std::move(pair.first), n = std::move(pair.second)]() mutable {
                    return matchStatement(type, std::move(o), std::move(n), period);
                }));
        }
        for (auto& f : matches) {
            report.statements.push_back(f.get());
        }
        t2 = std::chrono::high_resolution_clock::now();
        report.timing.match_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
    } catch (const std::exception& e) {
        report.statements.clear();
        report.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Fatal,
            "InternalError", std::string("Analysis failed: ") + e.what()));
        return report;
    }

    // Stage 3: top-level variances
    auto t1 = std::chrono::high_resolution_clock::now();
    for (auto& statement : report.statements) {
        measureStatement(statement);
        if (statement.success) report.success = true;
        if (report.period.empty()) report.period = statement.period;
    }
    auto t2 = std::chrono::high_resolution_clock::now();
    report.timing.variance_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    report.consistency = checkConsistency(report.statements);

    auto pipeline_end = std::chrono::high_resolution_clock::now();
    report.timing.total_time_ms = std::chrono::duration<double, std::milli>(pipeline_end - pipeline_start).count();

    if (options_.verbose) {
        std::cerr << "[analyze] " << report.statements.size() << " statements in "
                  << report.timing.total_time_ms << " ms (detect " << report.timing.detect_time_ms
                  << ", match " << report.timing.match_time_ms << ", variance "
                  << report.timing.variance_time_ms << "), compatibility "
                  << report.consistency.compatibilityScore << "\n";
    }
    return report;
}

StatementAnalysis VarianceAnalyzer::matchStatement(StatementType type, SheetStructure oldStructure,
                                                   SheetStructure newStructure,
                                                   const std::string& period) const {
    StatementAnalysis statement;
    statement.statementType = type;
    statement.period = period;
    statement.oldStructure = std::move(oldStructure);
    statement.newStructure = std::move(newStructure);
    append(statement.findings, statement.oldStructure.findings);
    append(statement.findings, statement.newStructure.findings);

    if (!statement.oldStructure.success || !statement.newStructure.success) {
        return statement;
    }

    LineItemMatcher matcher(options_);
    statement.match = matcher.match(statement.oldStructure.extraction.items,
                                    statement.newStructure.extraction.items);
    append(statement.findings, statement.match.findings);

    const auto& oldPeriods = statement.oldStructure.periods.periods;
    const auto& newPeriods = statement.newStructure.periods.periods;
    statement.alignment = alignPeriods(oldPeriods, newPeriods);

    // No selection: most recent period common to both models
    if (statement.period.empty() && !statement.alignment.common.empty()) {
        statement.period = statement.alignment.common.back().oldLabel;
    }

    statement.oldPeriodLabel = resolvePeriodLabel(statement.period, oldPeriods);
    statement.newPeriodLabel = resolvePeriodLabel(statement.period, newPeriods);
    for (auto side : {ModelSide::Old, ModelSide::New}) {
        bool found = side == ModelSide::Old ? statement.oldPeriodLabel.has_value()
                                            : statement.newPeriodLabel.has_value();
        if (found) continue;
        SourceLocation loc;
        loc.side = side;
        loc.sheet = side == ModelSide::Old ? statement.oldStructure.sheet : statement.newStructure.sheet;
        loc.row = side == ModelSide::Old ? statement.oldStructure.periods.headerRow
                                         : statement.newStructure.periods.headerRow;
        statement.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Warning,
            "PeriodNotFound", "Period '" + statement.period + "' is not a column of this sheet", loc));
    }

    statement.success = true;

    if (options_.verbose) {
        std::cerr << "[match] " << statementTypeToString(type) << ": " << statement.match.exactCount
                  << " exact, " << statement.match.fuzzyCount << " fuzzy, "
                  << statement.match.oldOnlyCount << " old only, " << statement.match.newOnlyCount
                  << " new only\n";
    }
    return statement;
}

void VarianceAnalyzer::measureStatement(StatementAnalysis& statement) const {
    if (!statement.success) return;

    VarianceEngine engine(options_);
    std::string oldLabel = statement.oldPeriodLabel.value_or("");
    std::string newLabel = statement.newPeriodLabel.value_or("");
    statement.variances.reserve(statement.match.pairs.size());
    for (const auto& pair : statement.match.pairs) {
        statement.variances.push_back(engine.computeVariance(pair, oldLabel, newLabel));
    }
}

// ============================================================================
// Model consistency
// ============================================================================

ConsistencyCheck checkConsistency(const std::vector<StatementAnalysis>& statements) {
    ConsistencyCheck check;
    check.structureMatch = !statements.empty();

    size_t shared = 0;
    size_t distinct = 0;
    for (const auto& s : statements) {
        bool oldParsed = s.oldStructure.success;
        bool newParsed = s.newStructure.success;
        if (oldParsed != newParsed) {
            check.structureMatch = false;
            check.issues.push_back(statementTypeToString(s.statementType) + " parsed in the " +
                                   (oldParsed ? "old" : "new") + " model only");
            continue;
        }
        if (!oldParsed) continue;

        if (!s.alignment.common.empty()) check.periodAlignmentPossible = true;

        std::set<std::string> oldNames;
        std::set<std::string> newNames;
        for (const auto& item : s.oldStructure.extraction.items) oldNames.insert(item.name);
        for (const auto& item : s.newStructure.extraction.items) newNames.insert(item.name);
        std::set<std::string> all = oldNames;
        all.insert(newNames.begin(), newNames.end());
        for (const auto& name : oldNames) {
            if (newNames.count(name)) ++shared;
        }
        distinct += all.size();
    }

    if (!check.structureMatch && check.issues.empty()) {
        check.issues.push_back("No statements were analysed");
    }
    if (!check.periodAlignmentPossible) {
        check.warnings.push_back("No common periods found; comparison is limited");
    }
    check.namingConsistency = distinct > 0 ? static_cast<double>(shared) / static_cast<double>(distinct) : 1.0;
    check.compatibilityScore = (check.structureMatch ? 0.4 : 0.0) + 0.3 * check.namingConsistency +
                               (check.periodAlignmentPossible ? 0.3 : 0.0);
    return check;
}

// ============================================================================
// Drill-down
// ============================================================================

DrillDownResult VarianceAnalyzer::drillDown(const StatementAnalysis& statement,
                                            const std::string& lineItemName) const {
    DrillDownResult result;
    result.lineItemName = lineItemName;
    result.period = statement.period;

    auto reject = [&result](DrillDownFailure reason, const std::string& message) {
        result.states = {DrillDownState::Requested, DrillDownState::Failed};
        result.status = DrillDownStatus::Failed;
        result.failureReason = reason;
        result.message = message;
        return result;
    };

    const MatchedPair* pair = statement.findPair(lineItemName);
    if (!pair) {
        return reject(DrillDownFailure::ItemNotFound,
                      "No line item '" + lineItemName + "' in " + statementTypeToString(statement.statementType));
    }
    if (!pair->isMatched()) {
        return reject(DrillDownFailure::ItemNotFound,
                      "'" + lineItemName + "' exists only in the " +
                      (pair->oldItem ? std::string("old") : std::string("new")) + " model");
    }
    if (!statement.oldPeriodLabel || !statement.newPeriodLabel) {
        return reject(DrillDownFailure::PeriodNotFound,
                      "Period '" + statement.period + "' is missing from one of the models");
    }

    const Period* oldPeriod = statement.oldStructure.periods.find(*statement.oldPeriodLabel);
    const Period* newPeriod = statement.newStructure.periods.find(*statement.newPeriodLabel);
    if (!oldPeriod || !newPeriod) {
        return reject(DrillDownFailure::PeriodNotFound,
                      "Period '" + statement.period + "' has no column in one of the models");
    }

    auto locate = [](const WorkbookModel& workbook, const LineItem& item, int col) {
        const Cell* found = workbook.cell(item.sheet, item.row, col);
        if (found) return *found;
        Cell blank;
        blank.sheet = item.sheet;
        blank.row = item.row;
        blank.col = col;
        return blank;
    };
    Cell oldCell = locate(*oldWorkbook_, *pair->oldItem, oldPeriod->columnIndex);
    Cell newCell = locate(*newWorkbook_, *pair->newItem, newPeriod->columnIndex);

    try {
        VarianceEngine engine(options_);
        DrillDownResult attributed = engine.drillDown(*oldWorkbook_, oldCell, *newWorkbook_, newCell);
        attributed.lineItemName = pair->displayName();
        attributed.period = statement.period;
        return attributed;
    } catch (const std::exception& e) {
        result.findings.push_back(makeFinding(ErrorCategory::GraphError, Severity::Fatal,
            "InternalError", std::string("Drill-down failed: ") + e.what()));
        return reject(DrillDownFailure::ParseError, e.what());
    }
}

}  // namespace finvar
