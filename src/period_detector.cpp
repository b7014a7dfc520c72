#include "finvar/period_detector.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace finvar {

namespace {

const std::string kMonthNames =
    "(?:January|February|March|April|May|June|July|August|September|October|November|December|"
    "Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sept|Sep|Oct|Nov|Dec)";

std::string trimmed(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string escapeRegex(char c) {
    static const std::string special = "\\^$.|?*+()[]{}";
    if (special.find(c) != std::string::npos) return std::string("\\") + c;
    if (std::isspace(static_cast<unsigned char>(c))) return "\\s*";
    return std::string(1, c);
}

// Phone numbers, long digit strings and contact rows are never periods
bool isExcludedText(const std::string& text) {
    static const std::regex phone(R"(^\d{3}-\d{3}-\d{4}$)");
    static const std::regex longDigits(R"(^\d{10,}$)");
    if (std::regex_match(text, phone) || std::regex_match(text, longDigits)) return true;
    std::string lower = toLower(text);
    for (const char* word : {"phone", "tel", "fax", "contact"}) {
        if (lower.find(word) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

const std::string& monthNamePattern() {
    return kMonthNames;
}

// ============================================================================
// Templates
// ============================================================================

std::string templateToRegex(const std::string& pattern) {
    if (pattern.rfind("re:", 0) == 0) {
        return pattern.substr(3);
    }

    static const std::map<std::string, std::string> placeholders = {
        {"YYYY", R"(\d{4})"},
        {"YY", R"(\d{2})"},
        {"Q", "[1-4]"},
        {"H", "[12]"},
        {"M", "(?:1[0-2]|0?[1-9])"},
        {"MM", "(?:0[1-9]|1[0-2])"},
        {"MMM", kMonthNames},
        {"WW", R"((?:0[1-9]|[1-4]\d|5[0-3]))"},
    };

    std::string out;
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '{') {
            size_t close = pattern.find('}', i);
            if (close == std::string::npos) {
                throw std::invalid_argument("unclosed placeholder in template '" + pattern + "'");
            }
            std::string name = pattern.substr(i + 1, close - i - 1);
            std::string upper = name;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            auto it = placeholders.find(upper);
            if (it == placeholders.end()) {
                throw std::invalid_argument("unknown placeholder {" + name + "} in template '" + pattern + "'");
            }
            out += it->second;
            i = close + 1;
        } else if (c == '[') {
            size_t close = pattern.find(']', i);
            if (close == std::string::npos) {
                throw std::invalid_argument("unclosed optional part in template '" + pattern + "'");
            }
            out += "(?:";
            for (size_t k = i + 1; k < close; ++k) out += escapeRegex(pattern[k]);
            out += ")?";
            i = close + 1;
        } else {
            out += escapeRegex(c);
            ++i;
        }
    }
    return out;
}

std::vector<PeriodTemplate> suggestTemplatesFromSamples(const std::vector<std::string>& labels) {
    struct Rule {
        std::regex regex;
        std::string name;
        std::string pattern;     // Without the estimate suffix
        std::string type;
        bool estimateSuffix;     // Append [E] when the sample ends with E
    };
    static const std::vector<Rule> rules = {
        {std::regex(R"(^FY\d{4}E?$)"), "Annual FY Format", "FY{YYYY}", "annual", true},
        {std::regex(R"(^FY[1-4]Q\d{2}E?$)"), "Quarterly FY Format", "FY{Q}Q{YY}", "quarterly", true},
        {std::regex(R"(^\d{4}E?$)"), "Simple Annual Format", "{YYYY}", "annual", true},
        {std::regex(R"(^[1-4]Q\d{2}E?$)"), "Simple Quarterly Format", "{Q}Q{YY}", "quarterly", true},
        {std::regex(R"(^Q[1-4]\s+\d{4}$)"), "Quarterly Q Format", "Q{Q} {YYYY}", "quarterly", false},
        {std::regex(R"(^\d{4}-\d{2}$)"), "Year-Week Format", "{YYYY}-{WW}", "weekly", false},
    };

    std::vector<PeriodTemplate> suggested;
    for (const auto& raw : labels) {
        std::string label = trimmed(raw);
        for (const auto& rule : rules) {
            if (!std::regex_match(label, rule.regex)) continue;
            PeriodTemplate t;
            t.name = rule.name;
            t.pattern = rule.pattern;
            if (rule.estimateSuffix && !label.empty() && label.back() == 'E') {
                t.pattern += "[E]";
            }
            t.example = label;
            t.type = rule.type;
            if (std::find(suggested.begin(), suggested.end(), t) == suggested.end()) {
                suggested.push_back(t);
            }
            break;
        }
    }
    return suggested;
}

std::optional<std::vector<PeriodTemplate>> loadPeriodTemplatesJSON(const std::string& jsonText,
                                                                   std::string& errorMessage) {
    try {
        json j = json::parse(jsonText);
        // Accept a bare array or {"templates": [...]}
        if (j.is_object() && j.contains("templates")) {
            j = j.at("templates");
        }
        if (!j.is_array()) {
            errorMessage = "expected an array of period templates";
            return std::nullopt;
        }
        std::vector<PeriodTemplate> templates;
        for (const auto& jt : j) {
            PeriodTemplate t;
            t.pattern = jt.at("pattern").get<std::string>();
            t.name = jt.value("name", t.pattern);
            t.type = jt.value("type", std::string("annual"));
            t.example = jt.value("example", std::string());
            templates.push_back(t);
        }
        return templates;
    } catch (const json::exception& e) {
        errorMessage = e.what();
        return std::nullopt;
    }
}

// ============================================================================
// Detection Result
// ============================================================================

const Period* PeriodDetectionResult::find(const std::string& label) const {
    for (const auto& p : periods) {
        if (p.label == label) return &p;
    }
    return nullptr;
}

// ============================================================================
// Period Detector
// ============================================================================

PeriodDetector::PeriodDetector(const EngineOptions& options) : options_(options) {
    initializeDefaultPatterns();
}

void PeriodDetector::initializeDefaultPatterns() {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    auto add = [&](const std::string& name, const std::string& source, bool checkYear) {
        patterns_.push_back({name, std::regex("^(?:" + source + ")$", flags), checkYear});
    };

    // Quarters: Q1, Q1 2024, Q1'24, Q1 24, 1Q24, 1Q2024E, FY1Q25, FY2Q, 2024 Q1
    add("quarter", R"(Q[1-4](?:\s?\d{4}|\s?'\d{2}|\s\d{2})?\s?E?)", false);
    add("quarter-prefix", R"([1-4]Q(?:\d{4}|\d{2})E?)", false);
    add("fiscal-quarter", R"(FY\s?[1-4]Q(?:\d{4}|\d{2})?E?)", false);
    add("year-quarter", R"(\d{4}\s?Q[1-4]E?)", true);

    // Halves: H1 2024, H1'24, 1H24
    add("half", R"(H[12](?:\s?\d{4}|\s?'\d{2}|\s\d{2})E?)", false);
    add("half-prefix", R"([12]H(?:\d{4}|\d{2})E?)", false);

    // Years: 2024, 2024E, 2024A, FY2024, FY 2024E, FY24, CY2024, 2024 Actual
    add("year", R"(\d{4}[AEFB]?)", true);
    add("fiscal-year", R"(FY\s?(?:\d{4}|\d{2})[AEFB]?)", false);
    add("calendar-year", R"(CY\s?(?:\d{4}|\d{2})[AEFB]?)", false);
    add("year-scenario", R"(\d{4}\s?(?:Actuals?|Estimates?|Forecast|Budget|Plan))", true);

    // Months: Mar 2024, Mar-24, March 2024, Mar'24, 3/2024
    add("month", kMonthNames + R"(\.?(?:[\s\-']?\d{4}|[\s\-']\d{2}))", false);
    add("month-numeric", R"((?:0?[1-9]|1[0-2])/(?:\d{4}|\d{2}))", false);

    // Year-week / year-month: 1998-53, 2024-01
    add("year-week", R"(\d{4}-(?:0[1-9]|[1-4]\d|5[0-3]))", true);
}

void PeriodDetector::addTemplates(const std::vector<PeriodTemplate>& templates) {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    for (const auto& t : templates) {
        try {
            std::string source = templateToRegex(t.pattern);
            templatePatterns_.push_back({t.name, std::regex("^(?:" + source + ")$", flags), false});
            if (options_.verbose) {
                std::cerr << "[period] template '" << t.name << "' -> " << source << "\n";
            }
        } catch (const std::regex_error& e) {
            templateFindings_.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Warning,
                "InvalidPeriodTemplate",
                "Template '" + t.name + "' (" + t.pattern + ") is not a valid pattern: " + e.what()));
        } catch (const std::invalid_argument& e) {
            templateFindings_.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Warning,
                "InvalidPeriodTemplate", e.what()));
        }
    }
}

bool PeriodDetector::inYearRange(const std::string& text) const {
    // First run of 4 digits is the year
    for (size_t i = 0; i + 4 <= text.size(); ++i) {
        bool digits = true;
        for (size_t k = i; k < i + 4; ++k) {
            if (!std::isdigit(static_cast<unsigned char>(text[k]))) {
                digits = false;
                break;
            }
        }
        if (digits) {
            int year = std::stoi(text.substr(i, 4));
            return year >= options_.yearMin && year <= options_.yearMax;
        }
    }
    return true;
}

bool PeriodDetector::isPeriodToken(const std::string& rawText) const {
    std::string text = trimmed(rawText);
    if (text.empty() || text.size() > 40) return false;
    if (isExcludedText(text)) return false;

    for (const auto& p : patterns_) {
        if (std::regex_match(text, p.regex)) {
            if (p.checkYearRange && !inYearRange(text)) continue;
            return true;
        }
    }
    for (const auto& p : templatePatterns_) {
        if (std::regex_match(text, p.regex)) return true;
    }
    return false;
}

std::optional<std::string> PeriodDetector::periodLabel(const Cell& cell) const {
    if (const auto* s = std::get_if<std::string>(&cell.rawValue)) {
        if (isPeriodToken(*s)) return *s;
        return std::nullopt;
    }
    if (options_.numericYearHeaders) {
        if (const auto* d = std::get_if<double>(&cell.rawValue)) {
            if (std::isfinite(*d) && std::floor(*d) == *d &&
                *d >= options_.yearMin && *d <= options_.yearMax) {
                return std::to_string(static_cast<int>(*d));
            }
        }
    }
    return std::nullopt;
}

PeriodDetectionResult PeriodDetector::detect(const Sheet& sheet) const {
    PeriodDetectionResult result;
    result.findings = templateFindings_;

    int scanRows = std::min(options_.headerScanRows, sheet.maxRow());
    result.rowScores.assign(static_cast<size_t>(std::max(scanRows, 0)), 0);

    // Cells are stored row-major, so the scan stops at the first row past K
    for (const auto& [rc, cell] : sheet.cells()) {
        if (rc.first > scanRows) break;
        if (periodLabel(cell)) {
            ++result.rowScores[static_cast<size_t>(rc.first - 1)];
        }
    }

    int bestRow = 0;
    int bestCount = 0;
    for (int row = 1; row <= scanRows; ++row) {
        int count = result.rowScores[static_cast<size_t>(row - 1)];
        if (count >= options_.minPeriodMatches && count > bestCount) {
            bestRow = row;
            bestCount = count;
        }
    }

    if (bestRow == 0) {
        SourceLocation loc;
        loc.sheet = sheet.name();
        result.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Fatal,
            "NoPeriodHeaderFound",
            "No row among the first " + std::to_string(options_.headerScanRows) +
            " has at least " + std::to_string(options_.minPeriodMatches) + " period headers",
            loc));
        if (options_.verbose) {
            std::cerr << "[period] " << sheet.name() << ": no period header row\n";
        }
        return result;
    }

    result.success = true;
    result.headerRow = bestRow;
    result.matchCount = bestCount;

    std::map<std::string, int> firstColumn;
    for (int col = 1; col <= sheet.maxColumn(); ++col) {
        const Cell* cell = sheet.cell(bestRow, col);
        if (!cell) continue;
        auto label = periodLabel(*cell);
        if (!label) continue;

        Period p;
        p.label = *label;
        p.columnIndex = col;
        p.sheet = sheet.name();
        p.headerRow = bestRow;
        result.periods.push_back(p);

        auto [it, inserted] = firstColumn.emplace(p.label, col);
        if (!inserted) {
            SourceLocation loc;
            loc.sheet = sheet.name();
            loc.row = bestRow;
            loc.col = col;
            result.findings.push_back(makeFinding(ErrorCategory::StructuralError, Severity::Warning,
                "DuplicatePeriodLabel",
                "Period '" + p.label + "' also appears in column " + columnToLetters(it->second) +
                "; values are read from the first occurrence",
                loc));
        }
    }

    if (options_.verbose) {
        std::cerr << "[period] " << sheet.name() << ": header row " << bestRow
                  << ", " << result.periods.size() << " periods\n";
    }
    return result;
}

}  // namespace finvar
