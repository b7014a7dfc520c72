#pragma once

#include "diagnostics.h"
#include "line_items.h"
#include "options.h"
#include "period_detector.h"
#include <optional>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Matched Pair
// ============================================================================

enum class MatchKind {
    Exact,
    Fuzzy,
    OldOnly,
    NewOnly
};

std::string matchKindToString(MatchKind kind);

struct MatchedPair {
    std::optional<LineItem> oldItem;
    std::optional<LineItem> newItem;
    double confidence = 0.0;
    MatchKind kind = MatchKind::Exact;

    bool isMatched() const { return kind == MatchKind::Exact || kind == MatchKind::Fuzzy; }

    // Name shown for the pair: the old label when present, else the new one
    const std::string& displayName() const;
};

// ============================================================================
// Similarity
// ============================================================================

// Levenshtein distance on bytes
size_t editDistance(const std::string& a, const std::string& b);

// 1 - distance / max(len), in [0, 1]
double editRatio(const std::string& a, const std::string& b);

// Lower-cased alphanumeric tokens
std::vector<std::string> tokenizeLabel(const std::string& label);

// Jaccard over token sets where two tokens are equal when their
// edit ratio is at least 0.8
double softTokenJaccard(const std::string& a, const std::string& b);

// 0.5 * softTokenJaccard + 0.5 * editRatio, both on lower-cased text
double labelSimilarity(const std::string& a, const std::string& b);

// ============================================================================
// Line Item Matcher
// ============================================================================

struct MatchResult {
    std::vector<MatchedPair> pairs;
    int exactCount = 0;
    int fuzzyCount = 0;
    int oldOnlyCount = 0;
    int newOnlyCount = 0;
    std::vector<Finding> findings;
};

class LineItemMatcher {
public:
    explicit LineItemMatcher(const EngineOptions& options = EngineOptions());

    // One-to-one pairing covering every item of both lists
    MatchResult match(const std::vector<LineItem>& oldItems,
                      const std::vector<LineItem>& newItems) const;

private:
    EngineOptions options_;
};

// ============================================================================
// Period Alignment
// ============================================================================

struct PeriodAlignment {
    struct Entry {
        std::string oldLabel;
        std::string newLabel;
        bool exact = true;
    };
    std::vector<Entry> common;          // In old column order
    std::vector<std::string> oldOnly;
    std::vector<std::string> newOnly;
};

// Canonical correlation key ("Q1 2024" and "1Q24" -> "2024-Q1", "FY1Q24" -> "FY2024-Q1").
// Used for alignment only; labels themselves are never rewritten.
std::string canonicalPeriodKey(const std::string& label);

PeriodAlignment alignPeriods(const std::vector<Period>& oldPeriods,
                             const std::vector<Period>& newPeriods);

// Label of the selected period on one side: exact label first, then the
// aligned counterpart. nullopt if the side has no such period.
std::optional<std::string> resolvePeriodLabel(const std::string& selected,
                                              const std::vector<Period>& sidePeriods);

}  // namespace finvar
