#include "finvar/matcher.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <regex>
#include <set>

namespace finvar {

namespace {

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trimmed(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

SourceLocation itemLocation(const LineItem& item, ModelSide side) {
    SourceLocation loc;
    loc.side = side;
    loc.sheet = item.sheet;
    loc.row = item.row;
    loc.col = item.labelColumn;
    return loc;
}

}  // namespace

std::string matchKindToString(MatchKind kind) {
    switch (kind) {
        case MatchKind::Exact: return "exact";
        case MatchKind::Fuzzy: return "fuzzy";
        case MatchKind::OldOnly: return "old_only";
        case MatchKind::NewOnly: return "new_only";
        default: return "unknown";
    }
}

const std::string& MatchedPair::displayName() const {
    if (oldItem) return oldItem->name;
    return newItem->name;
}

// ============================================================================
// Similarity
// ============================================================================

size_t editDistance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double editRatio(const std::string& a, const std::string& b) {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(editDistance(a, b)) / static_cast<double>(longest);
}

std::vector<std::string> tokenizeLabel(const std::string& label) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : label) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || u >= 0x80) {
            current += static_cast<char>(std::tolower(u));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);

    // Set semantics
    std::vector<std::string> unique;
    for (const auto& t : tokens) {
        if (std::find(unique.begin(), unique.end(), t) == unique.end()) unique.push_back(t);
    }
    return unique;
}

double softTokenJaccard(const std::string& a, const std::string& b) {
    auto ta = tokenizeLabel(a);
    auto tb = tokenizeLabel(b);
    if (ta.empty() && tb.empty()) return 1.0;
    if (ta.empty() || tb.empty()) return 0.0;

    // One-to-one token pairing: exact tokens first, then near-equal ones
    std::vector<bool> usedB(tb.size(), false);
    std::vector<bool> usedA(ta.size(), false);
    size_t matched = 0;
    for (size_t i = 0; i < ta.size(); ++i) {
        for (size_t j = 0; j < tb.size(); ++j) {
            if (!usedB[j] && ta[i] == tb[j]) {
                usedA[i] = usedB[j] = true;
                ++matched;
                break;
            }
        }
    }
    for (size_t i = 0; i < ta.size(); ++i) {
        if (usedA[i]) continue;
        for (size_t j = 0; j < tb.size(); ++j) {
            if (!usedB[j] && editRatio(ta[i], tb[j]) >= 0.8) {
                usedA[i] = usedB[j] = true;
                ++matched;
                break;
            }
        }
    }
    size_t unionSize = ta.size() + tb.size() - matched;
    return static_cast<double>(matched) / static_cast<double>(unionSize);
}

double labelSimilarity(const std::string& a, const std::string& b) {
    std::string la = toLower(trimmed(a));
    std::string lb = toLower(trimmed(b));
    return 0.5 * softTokenJaccard(la, lb) + 0.5 * editRatio(la, lb);
}

// ============================================================================
// Line Item Matcher
// ============================================================================

LineItemMatcher::LineItemMatcher(const EngineOptions& options) : options_(options) {}

MatchResult LineItemMatcher::match(const std::vector<LineItem>& oldItems,
                                   const std::vector<LineItem>& newItems) const {
    MatchResult result;

    std::vector<int> oldToNew(oldItems.size(), -1);
    std::vector<double> confidence(oldItems.size(), 0.0);
    std::vector<MatchKind> kind(oldItems.size(), MatchKind::OldOnly);
    std::vector<bool> newUsed(newItems.size(), false);

    auto exactPass = [&](bool caseSensitive) {
        for (size_t i = 0; i < oldItems.size(); ++i) {
            if (oldToNew[i] >= 0) continue;
            std::string key = caseSensitive ? oldItems[i].name : toLower(trimmed(oldItems[i].name));
            for (size_t j = 0; j < newItems.size(); ++j) {
                if (newUsed[j]) continue;
                std::string candidate = caseSensitive ? newItems[j].name : toLower(trimmed(newItems[j].name));
                if (key == candidate) {
                    oldToNew[i] = static_cast<int>(j);
                    newUsed[j] = true;
                    confidence[i] = 1.0;
                    kind[i] = MatchKind::Exact;
                    break;
                }
            }
        }
    };

    // Pass 1: exact, case-sensitive then case-insensitive
    exactPass(true);
    exactPass(false);

    // Pass 2: fuzzy, greedy over all candidates by descending score
    struct Candidate {
        double score;
        size_t oldIndex;
        size_t newIndex;
    };
    std::vector<Candidate> candidates;
    for (size_t i = 0; i < oldItems.size(); ++i) {
        if (oldToNew[i] >= 0) continue;
        for (size_t j = 0; j < newItems.size(); ++j) {
            if (newUsed[j]) continue;
            double score = labelSimilarity(oldItems[i].name, newItems[j].name);
            if (score >= options_.fuzzyThreshold) {
                candidates.push_back({score, i, j});
            }
        }
    }
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.oldIndex != b.oldIndex) return a.oldIndex < b.oldIndex;
        return a.newIndex < b.newIndex;
    });
    for (const auto& c : candidates) {
        if (oldToNew[c.oldIndex] >= 0 || newUsed[c.newIndex]) continue;
        oldToNew[c.oldIndex] = static_cast<int>(c.newIndex);
        newUsed[c.newIndex] = true;
        confidence[c.oldIndex] = c.score;
        kind[c.oldIndex] = MatchKind::Fuzzy;
    }

    // Pass 3: leftovers. Pairs holding an old item come first in old order.
    for (size_t i = 0; i < oldItems.size(); ++i) {
        MatchedPair pair;
        pair.oldItem = oldItems[i];
        pair.kind = kind[i];
        pair.confidence = confidence[i];
        if (oldToNew[i] >= 0) {
            pair.newItem = newItems[static_cast<size_t>(oldToNew[i])];
            if (pair.kind == MatchKind::Exact) ++result.exactCount;
            else ++result.fuzzyCount;
        } else {
            ++result.oldOnlyCount;
            result.findings.push_back(makeFinding(ErrorCategory::MatchingWarning, Severity::Warning,
                "OldOnlyLineItem",
                "'" + oldItems[i].name + "' has no counterpart in the new model",
                itemLocation(oldItems[i], ModelSide::Old)));
        }
        result.pairs.push_back(std::move(pair));
    }
    for (size_t j = 0; j < newItems.size(); ++j) {
        if (newUsed[j]) continue;
        MatchedPair pair;
        pair.newItem = newItems[j];
        pair.kind = MatchKind::NewOnly;
        pair.confidence = 0.0;
        ++result.newOnlyCount;
        result.findings.push_back(makeFinding(ErrorCategory::MatchingWarning, Severity::Warning,
            "NewOnlyLineItem",
            "'" + newItems[j].name + "' has no counterpart in the old model",
            itemLocation(newItems[j], ModelSide::New)));
        result.pairs.push_back(std::move(pair));
    }

    if (options_.verbose) {
        std::cerr << "[match] exact=" << result.exactCount << " fuzzy=" << result.fuzzyCount
                  << " old_only=" << result.oldOnlyCount << " new_only=" << result.newOnlyCount << "\n";
    }
    return result;
}

// ============================================================================
// Period Alignment
// ============================================================================

namespace {

int expandYear(const std::string& digits) {
    int y = std::stoi(digits);
    return digits.size() == 2 ? 2000 + y : y;
}

int monthIndex(const std::string& name) {
    static const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string prefix = toLower(name.substr(0, 3));
    for (int i = 0; i < 12; ++i) {
        if (prefix == months[i]) return i + 1;
    }
    return 0;
}

std::string twoDigits(int n) {
    return (n < 10 ? "0" : "") + std::to_string(n);
}

}  // namespace

std::string canonicalPeriodKey(const std::string& label) {
    static const auto icase = std::regex::ECMAScript | std::regex::icase;
    static const std::regex quarterFirst(R"(^Q([1-4])\s*'?(\d{4}|\d{2})\s?E?$)", icase);
    static const std::regex quarterPrefix(R"(^([1-4])Q(\d{4}|\d{2})E?$)", icase);
    static const std::regex fiscalQuarter(R"(^FY\s?([1-4])Q(\d{4}|\d{2})E?$)", icase);
    static const std::regex yearQuarter(R"(^(\d{4})\s?Q([1-4])E?$)", icase);
    static const std::regex halfFirst(R"(^H([12])\s*'?(\d{4}|\d{2})E?$)", icase);
    static const std::regex halfPrefix(R"(^([12])H(\d{4}|\d{2})E?$)", icase);
    static const std::regex year(R"(^(\d{4})\s?(?:[AEFB]|Actuals?|Estimates?|Forecast|Budget|Plan)?$)", icase);
    static const std::regex fiscalYear(R"(^FY\s?(\d{4}|\d{2})[AEFB]?$)", icase);
    static const std::regex calendarYear(R"(^CY\s?(\d{4}|\d{2})[AEFB]?$)", icase);
    static const std::regex monthName("^(" + monthNamePattern() + R"()\.?[\s\-']?(\d{4}|\d{2})$)", icase);
    static const std::regex monthNumeric(R"(^(\d{1,2})/(\d{4}|\d{2})$)", icase);

    std::string text = trimmed(label);
    std::smatch m;
    if (std::regex_match(text, m, quarterFirst)) {
        return std::to_string(expandYear(m[2].str())) + "-Q" + m[1].str();
    }
    if (std::regex_match(text, m, quarterPrefix)) {
        return std::to_string(expandYear(m[2].str())) + "-Q" + m[1].str();
    }
    if (std::regex_match(text, m, fiscalQuarter)) {
        return "FY" + std::to_string(expandYear(m[2].str())) + "-Q" + m[1].str();
    }
    if (std::regex_match(text, m, yearQuarter)) {
        return m[1].str() + "-Q" + m[2].str();
    }
    if (std::regex_match(text, m, halfFirst)) {
        return std::to_string(expandYear(m[2].str())) + "-H" + m[1].str();
    }
    if (std::regex_match(text, m, halfPrefix)) {
        return std::to_string(expandYear(m[2].str())) + "-H" + m[1].str();
    }
    if (std::regex_match(text, m, year)) {
        return m[1].str();
    }
    if (std::regex_match(text, m, fiscalYear)) {
        return "FY" + std::to_string(expandYear(m[1].str()));
    }
    if (std::regex_match(text, m, calendarYear)) {
        return std::to_string(expandYear(m[1].str()));
    }
    if (std::regex_match(text, m, monthName)) {
        int month = monthIndex(m[1].str());
        if (month > 0) {
            return std::to_string(expandYear(m[2].str())) + "-M" + twoDigits(month);
        }
    }
    if (std::regex_match(text, m, monthNumeric)) {
        int month = std::stoi(m[1].str());
        if (month >= 1 && month <= 12) {
            return std::to_string(expandYear(m[2].str())) + "-M" + twoDigits(month);
        }
    }
    return toLower(text);
}

PeriodAlignment alignPeriods(const std::vector<Period>& oldPeriods,
                             const std::vector<Period>& newPeriods) {
    PeriodAlignment alignment;

    std::vector<std::string> oldLabels;
    std::vector<std::string> newLabels;
    std::set<std::string> seen;
    for (const auto& p : oldPeriods) {
        if (seen.insert(p.label).second) oldLabels.push_back(p.label);
    }
    seen.clear();
    for (const auto& p : newPeriods) {
        if (seen.insert(p.label).second) newLabels.push_back(p.label);
    }

    std::vector<bool> newUsed(newLabels.size(), false);
    std::vector<bool> oldAligned(oldLabels.size(), false);
    std::vector<PeriodAlignment::Entry> entries(oldLabels.size());

    // Exact labels first so a canonical match never steals an exact one
    for (size_t i = 0; i < oldLabels.size(); ++i) {
        for (size_t j = 0; j < newLabels.size(); ++j) {
            if (!newUsed[j] && oldLabels[i] == newLabels[j]) {
                entries[i] = {oldLabels[i], newLabels[j], true};
                oldAligned[i] = newUsed[j] = true;
                break;
            }
        }
    }
    for (size_t i = 0; i < oldLabels.size(); ++i) {
        if (oldAligned[i]) continue;
        std::string key = canonicalPeriodKey(oldLabels[i]);
        for (size_t j = 0; j < newLabels.size(); ++j) {
            if (!newUsed[j] && canonicalPeriodKey(newLabels[j]) == key) {
                entries[i] = {oldLabels[i], newLabels[j], false};
                oldAligned[i] = newUsed[j] = true;
                break;
            }
        }
    }

    for (size_t i = 0; i < oldLabels.size(); ++i) {
        if (oldAligned[i]) alignment.common.push_back(entries[i]);
        else alignment.oldOnly.push_back(oldLabels[i]);
    }
    for (size_t j = 0; j < newLabels.size(); ++j) {
        if (!newUsed[j]) alignment.newOnly.push_back(newLabels[j]);
    }
    return alignment;
}

std::optional<std::string> resolvePeriodLabel(const std::string& selected,
                                              const std::vector<Period>& sidePeriods) {
    for (const auto& p : sidePeriods) {
        if (p.label == selected) return p.label;
    }
    std::string key = canonicalPeriodKey(selected);
    for (const auto& p : sidePeriods) {
        if (canonicalPeriodKey(p.label) == key) return p.label;
    }
    return std::nullopt;
}

}  // namespace finvar
