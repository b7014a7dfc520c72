#include "finvar/sheet_classifier.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace finvar {

namespace {

const std::vector<std::string> kIncomeNameKeywords = {"income", "p&l", "pnl", "profit", "loss", "revenue", "sales", "earnings"};
const std::vector<std::string> kBalanceNameKeywords = {"balance", "bs", "assets", "liabilities", "equity", "position"};
const std::vector<std::string> kCashNameKeywords = {"cash", "flow", "cf", "operating", "investing", "financing"};

const std::vector<std::string> kIncomeLabelKeywords = {"revenue", "sales", "income", "profit", "loss", "earnings", "expense"};
const std::vector<std::string> kBalanceLabelKeywords = {"assets", "liabilities", "equity", "capital", "retained", "current"};
const std::vector<std::string> kCashLabelKeywords = {"operating", "investing", "financing", "cash", "flow", "payment"};

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Short keywords ("bs", "cf") must be a whole word of the sheet name
bool containsKeyword(const std::string& text, const std::string& keyword) {
    if (keyword.size() > 2) {
        return text.find(keyword) != std::string::npos;
    }
    size_t pos = text.find(keyword);
    while (pos != std::string::npos) {
        bool leftOk = pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
        size_t end = pos + keyword.size();
        bool rightOk = end >= text.size() || !std::isalnum(static_cast<unsigned char>(text[end]));
        if (leftOk && rightOk) return true;
        pos = text.find(keyword, pos + 1);
    }
    return false;
}

int countKeywords(const std::string& text, const std::vector<std::string>& keywords) {
    int n = 0;
    for (const auto& k : keywords) {
        if (containsKeyword(text, k)) ++n;
    }
    return n;
}

}  // namespace

int SheetScore::score(StatementType type) const {
    switch (type) {
        case StatementType::IncomeStatement: return incomeScore;
        case StatementType::BalanceSheet: return balanceScore;
        case StatementType::CashFlow: return cashFlowScore;
    }
    return 0;
}

std::optional<StatementType> SheetScore::bestType() const {
    std::optional<StatementType> best;
    int bestScore = 0;
    for (auto type : {StatementType::IncomeStatement, StatementType::BalanceSheet, StatementType::CashFlow}) {
        if (score(type) > bestScore) {
            bestScore = score(type);
            best = type;
        }
    }
    return best;
}

SheetScore scoreSheet(const Sheet& sheet, int labelRows) {
    SheetScore s;
    s.sheet = sheet.name();

    // Sheet-name hits weigh more than content hits
    std::string name = toLower(sheet.name());
    s.incomeScore += 3 * countKeywords(name, kIncomeNameKeywords);
    s.balanceScore += 3 * countKeywords(name, kBalanceNameKeywords);
    s.cashFlowScore += 3 * countKeywords(name, kCashNameKeywords);

    int lastRow = std::min(sheet.maxRow(), labelRows);
    for (int row = 1; row <= lastRow; ++row) {
        auto label = sheet.rowLabel(row);
        if (!label) continue;
        std::string text = toLower(*label);
        s.incomeScore += countKeywords(text, kIncomeLabelKeywords);
        s.balanceScore += countKeywords(text, kBalanceLabelKeywords);
        s.cashFlowScore += countKeywords(text, kCashLabelKeywords);
    }
    return s;
}

SheetSelection suggestSheetSelection(const WorkbookModel& workbook) {
    std::vector<SheetScore> scores;
    for (const auto& sheet : workbook.sheets()) {
        scores.push_back(scoreSheet(*sheet));
    }

    // Assign each type the highest-scoring sheet not yet taken; ties keep
    // workbook order.
    SheetSelection selection;
    std::set<std::string> taken;
    for (auto type : {StatementType::IncomeStatement, StatementType::BalanceSheet, StatementType::CashFlow}) {
        const SheetScore* best = nullptr;
        for (const auto& s : scores) {
            if (taken.count(s.sheet) || s.score(type) == 0) continue;
            // Only propose a sheet for the type it scores best on
            auto bt = s.bestType();
            if (!bt || *bt != type) continue;
            if (!best || s.score(type) > best->score(type)) best = &s;
        }
        if (best) {
            selection[type] = best->sheet;
            taken.insert(best->sheet);
        }
    }
    return selection;
}

}  // namespace finvar
