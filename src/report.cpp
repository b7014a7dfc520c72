#include "finvar/report.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace finvar {

namespace {

nlohmann::json optionalNumber(const std::optional<double>& value) {
    if (!value) return nullptr;
    return *value;
}

nlohmann::json findingsToJSON(const std::vector<Finding>& findings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : findings) {
        nlohmann::json fj;
        fj["category"] = categoryToString(f.category);
        fj["severity"] = severityToString(f.severity);
        fj["code"] = f.code;
        fj["message"] = f.message;
        if (!f.location.empty()) {
            fj["side"] = sideToString(f.location.side);
            fj["location"] = f.location.toString();
        }
        arr.push_back(fj);
    }
    return arr;
}

nlohmann::json periodsToJSON(const std::vector<Period>& periods) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : periods) {
        nlohmann::json pj;
        pj["label"] = p.label;
        pj["column"] = columnToLetters(p.columnIndex);
        pj["column_index"] = p.columnIndex;
        arr.push_back(pj);
    }
    return arr;
}

nlohmann::json structureToJSON(const SheetStructure& structure) {
    nlohmann::json j;
    j["side"] = sideToString(structure.side);
    j["statement_type"] = statementTypeToString(structure.statementType);
    j["sheet"] = structure.sheet;
    j["success"] = structure.success;
    j["header_row"] = structure.periods.headerRow;
    j["periods"] = periodsToJSON(structure.periods.periods);

    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : structure.extraction.items) {
        nlohmann::json ij;
        ij["name"] = item.name;
        ij["row"] = item.row;
        nlohmann::json values = nlohmann::json::object();
        for (const auto& p : structure.periods.periods) {
            if (values.contains(p.label)) continue;
            values[p.label] = optionalNumber(item.value(p.label));
        }
        ij["values"] = values;
        ij["has_formula"] = item.hasFormula();
        items.push_back(ij);
    }
    j["line_items"] = items;
    j["stop_row"] = structure.extraction.stopRow;
    j["section_headers"] = structure.extraction.sectionHeaderCount;

    nlohmann::json suggestions = nlohmann::json::array();
    for (const auto& t : structure.templateSuggestions) {
        nlohmann::json tj;
        tj["name"] = t.name;
        tj["pattern"] = t.pattern;
        tj["type"] = t.type;
        tj["example"] = t.example;
        suggestions.push_back(tj);
    }
    j["template_suggestions"] = suggestions;
    return j;
}

nlohmann::json consistencyToJSON(const ConsistencyCheck& check) {
    nlohmann::json j;
    j["structure_match"] = check.structureMatch;
    j["naming_consistency"] = check.namingConsistency;
    j["period_alignment_possible"] = check.periodAlignmentPossible;
    j["compatibility_score"] = check.compatibilityScore;
    j["issues_found"] = check.issues;
    j["warnings"] = check.warnings;
    return j;
}

nlohmann::json varianceToJSON(const VarianceResult& v) {
    nlohmann::json j;
    j["line_item_name"] = v.lineItemName;
    j["old_value"] = optionalNumber(v.oldValue);
    j["new_value"] = optionalNumber(v.newValue);
    j["absolute_variance"] = optionalNumber(v.absoluteVariance);
    j["percentage_variance"] = optionalNumber(v.percentageVariance);
    j["percentage_undefined"] = v.percentageUndefined;
    j["match_kind"] = matchKindToString(v.matchKind);
    j["match_confidence"] = v.matchConfidence;
    j["drill_down_available"] = v.drillDownAvailable;
    j["significant"] = v.significant;
    return j;
}

}  // namespace

// ============================================================================
// JSON Output
// ============================================================================

std::string generateStructureJSON(const SheetStructure& structure) {
    nlohmann::json j = structureToJSON(structure);
    j["findings"] = findingsToJSON(structure.findings);
    return j.dump(2);
}

std::string generateVarianceJSON(const AnalysisReport& report, bool includeTiming) {
    nlohmann::json j;
    j["success"] = report.success;
    j["period"] = report.period;

    nlohmann::json statements = nlohmann::json::array();
    for (const auto& s : report.statements) {
        nlohmann::json sj;
        sj["statement_type"] = statementTypeToString(s.statementType);
        sj["success"] = s.success;
        sj["period"] = s.period;
        sj["old_sheet"] = s.oldStructure.sheet;
        sj["new_sheet"] = s.newStructure.sheet;
        sj["old_period_label"] = s.oldPeriodLabel ? nlohmann::json(*s.oldPeriodLabel) : nlohmann::json(nullptr);
        sj["new_period_label"] = s.newPeriodLabel ? nlohmann::json(*s.newPeriodLabel) : nlohmann::json(nullptr);

        sj["match_stats"]["exact"] = s.match.exactCount;
        sj["match_stats"]["fuzzy"] = s.match.fuzzyCount;
        sj["match_stats"]["old_only"] = s.match.oldOnlyCount;
        sj["match_stats"]["new_only"] = s.match.newOnlyCount;

        nlohmann::json common = nlohmann::json::array();
        for (const auto& e : s.alignment.common) {
            nlohmann::json ej;
            ej["old"] = e.oldLabel;
            ej["new"] = e.newLabel;
            ej["exact"] = e.exact;
            common.push_back(ej);
        }
        sj["periods"]["common"] = common;
        sj["periods"]["old_only"] = s.alignment.oldOnly;
        sj["periods"]["new_only"] = s.alignment.newOnly;

        nlohmann::json variances = nlohmann::json::array();
        for (const auto& v : s.variances) {
            variances.push_back(varianceToJSON(v));
        }
        sj["variances"] = variances;
        sj["findings"] = findingsToJSON(s.findings);
        statements.push_back(sj);
    }
    j["statements"] = statements;
    j["consistency"] = consistencyToJSON(report.consistency);
    j["findings"] = findingsToJSON(report.findings);

    if (includeTiming) {
        j["timing"]["detect_time_ms"] = report.timing.detect_time_ms;
        j["timing"]["match_time_ms"] = report.timing.match_time_ms;
        j["timing"]["variance_time_ms"] = report.timing.variance_time_ms;
        j["timing"]["total_time_ms"] = report.timing.total_time_ms;
    }
    return j.dump(2);
}

std::string generateDrillDownJSON(const DrillDownResult& result) {
    nlohmann::json j;
    j["line_item_name"] = result.lineItemName;
    j["period"] = result.period;
    j["status"] = drillDownStatusToString(result.status);
    if (result.failureReason != DrillDownFailure::None) {
        j["failure_reason"] = failureToString(result.failureReason);
    }
    if (!result.message.empty()) {
        j["message"] = result.message;
    }
    j["source_value_old"] = optionalNumber(result.sourceValueOld);
    j["source_value_new"] = optionalNumber(result.sourceValueNew);
    j["old_formula"] = result.oldFormula;
    j["new_formula"] = result.newFormula;
    j["total_variance"] = result.totalVariance;
    j["total_explained"] = result.totalExplained;
    j["unexplained_variance"] = result.unexplainedVariance;

    nlohmann::json components = nlohmann::json::array();
    for (const auto& c : result.components) {
        nlohmann::json cj;
        cj["name"] = c.name;
        cj["old_cell"] = c.oldCellRef;
        cj["new_cell"] = c.newCellRef;
        cj["old_value"] = optionalNumber(c.oldValue);
        cj["new_value"] = optionalNumber(c.newValue);
        cj["coefficient"] = c.coefficient;
        cj["variance_contribution"] = c.varianceContribution;
        cj["percentage_variance"] = optionalNumber(c.percentageVariance);
        cj["percentage_undefined"] = c.percentageUndefined;
        cj["contribution_to_total"] = optionalNumber(c.contributionToTotal);
        cj["is_leaf"] = c.isLeaf;
        cj["has_formula"] = c.hasFormula;
        if (c.asymmetric) {
            cj["asymmetric"] = true;
            cj["side"] = sideToString(c.side);
        }
        components.push_back(cj);
    }
    j["components"] = components;

    nlohmann::json states = nlohmann::json::array();
    for (auto s : result.states) states.push_back(drillDownStateToString(s));
    j["states"] = states;
    j["findings"] = findingsToJSON(result.findings);
    return j.dump(2);
}

std::string generateSelectionJSON(const SheetSelection& selection) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [type, sheet] : selection) {
        j[statementTypeToString(type)] = sheet;
    }
    return j.dump(2);
}

std::string generateComplexityJSON(const FormulaComplexityInfo& info) {
    nlohmann::json j;
    j["has_formula"] = info.hasFormula;
    j["reference_count"] = info.referenceCount;
    j["has_cross_sheet"] = info.hasCrossSheet;
    j["has_external"] = info.hasExternal;
    j["main_function"] = info.mainFunction;
    j["nesting_depth"] = info.nestingDepth;
    j["complexity"] = complexityToString(info.complexity);
    j["can_drill_down"] = info.canDrillDown;
    return j.dump(2);
}

// ============================================================================
// Text Output
// ============================================================================

std::string formatAmount(const std::optional<double>& value) {
    if (!value) return "-";
    if (!std::isfinite(*value)) return "n/a";

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << std::fabs(*value);
    std::string digits = oss.str();

    // Thousands separators on the integer part
    size_t dot = digits.find('.');
    std::string integer = digits.substr(0, dot);
    std::string grouped;
    int count = 0;
    for (auto it = integer.rbegin(); it != integer.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    bool negative = *value < 0 && digits != "0.00";
    return (negative ? "-" : "") + grouped + digits.substr(dot);
}

std::string generateVarianceTable(const AnalysisReport& report) {
    std::ostringstream oss;

    for (const auto& s : report.statements) {
        oss << "=== " << statementTypeToString(s.statementType) << " (" << s.oldStructure.sheet;
        if (s.newStructure.sheet != s.oldStructure.sheet) oss << " / " << s.newStructure.sheet;
        oss << "), period " << s.period << " ===\n";

        if (!s.success) {
            oss << "  not analysed\n";
            oss << formatFindings(s.findings) << "\n";
            continue;
        }

        oss << std::left << std::setw(36) << "Line item"
            << std::right << std::setw(16) << "Old"
            << std::setw(16) << "New"
            << std::setw(16) << "Variance"
            << std::setw(10) << "%"
            << "  Match\n";
        oss << std::string(100, '-') << "\n";

        for (const auto& v : s.variances) {
            std::string name = v.lineItemName;
            if (name.size() > 34) name = name.substr(0, 33) + "~";

            std::string pct;
            if (v.percentageUndefined) {
                pct = "n/a";
            } else if (v.percentageVariance) {
                std::ostringstream p;
                p << std::fixed << std::setprecision(1) << *v.percentageVariance;
                pct = p.str();
            } else {
                pct = "-";
            }

            oss << std::left << std::setw(36) << name
                << std::right << std::setw(16) << formatAmount(v.oldValue)
                << std::setw(16) << formatAmount(v.newValue)
                << std::setw(16) << formatAmount(v.absoluteVariance)
                << std::setw(10) << pct
                << "  " << matchKindToString(v.matchKind);
            if (v.matchKind == MatchKind::Fuzzy) {
                oss << " (" << std::fixed << std::setprecision(2) << v.matchConfidence << ")";
            }
            if (v.significant) oss << " *";
            if (v.drillDownAvailable) oss << " >";
            oss << "\n";
        }

        if (!s.findings.empty()) {
            oss << "\n" << formatFindings(s.findings);
        }
        oss << "\n";
    }

    const auto& c = report.consistency;
    oss << "Compatibility " << std::fixed << std::setprecision(2) << c.compatibilityScore
        << " (structure " << (c.structureMatch ? "matches" : "differs")
        << ", naming " << c.namingConsistency
        << ", periods " << (c.periodAlignmentPossible ? "aligned" : "not aligned") << ")\n";
    for (const auto& issue : c.issues) oss << "  issue: " << issue << "\n";
    for (const auto& warning : c.warnings) oss << "  warning: " << warning << "\n";

    if (!report.findings.empty()) {
        oss << formatFindings(report.findings);
    }
    return oss.str();
}

std::string generateDrillDownTable(const DrillDownResult& result) {
    std::ostringstream oss;
    oss << "Drill-down: " << result.lineItemName << " @ " << result.period << "\n";
    oss << "Status: " << drillDownStatusToString(result.status);
    if (result.failureReason != DrillDownFailure::None) {
        oss << " (" << failureToString(result.failureReason) << ")";
    }
    oss << "\n";
    if (!result.message.empty()) oss << "  " << result.message << "\n";
    if (!result.oldFormula.empty()) oss << "Old formula: " << result.oldFormula << "\n";
    if (!result.newFormula.empty()) oss << "New formula: " << result.newFormula << "\n";

    if (result.success()) {
        oss << "\n" << std::left << std::setw(28) << "Component"
            << std::setw(14) << "Old cell"
            << std::setw(14) << "New cell"
            << std::right << std::setw(16) << "Old"
            << std::setw(16) << "New"
            << std::setw(16) << "Contribution" << "\n";
        oss << std::string(104, '-') << "\n";
        for (const auto& c : result.components) {
            std::string name = c.coefficient < 0 ? "-" + c.name : c.name;
            if (c.asymmetric) name += c.side == ModelSide::Old ? " [old]" : " [new]";
            oss << std::left << std::setw(28) << name
                << std::setw(14) << (c.oldCellRef.empty() ? "-" : c.oldCellRef)
                << std::setw(14) << (c.newCellRef.empty() ? "-" : c.newCellRef)
                << std::right << std::setw(16) << formatAmount(c.oldValue)
                << std::setw(16) << formatAmount(c.newValue)
                << std::setw(16) << formatAmount(c.varianceContribution) << "\n";
        }
        oss << std::string(104, '-') << "\n";
        oss << std::left << std::setw(56) << "Total variance" << std::right << std::setw(48)
            << formatAmount(result.totalVariance) << "\n";
        oss << std::left << std::setw(56) << "Explained" << std::right << std::setw(48)
            << formatAmount(result.totalExplained) << "\n";
        oss << std::left << std::setw(56) << "Unexplained" << std::right << std::setw(48)
            << formatAmount(result.unexplainedVariance) << "\n";
    }

    if (!result.findings.empty()) {
        oss << "\n" << formatFindings(result.findings);
    }
    return oss.str();
}

std::string formatFindings(const std::vector<Finding>& findings) {
    std::ostringstream oss;
    for (const auto& f : findings) {
        oss << "  " << severityToString(f.severity) << ": " << f.toString() << "\n";
    }
    return oss.str();
}

}  // namespace finvar
