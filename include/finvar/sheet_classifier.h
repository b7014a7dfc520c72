#pragma once

#include "line_items.h"
#include "workbook.h"
#include <map>
#include <string>
#include <vector>

namespace finvar {

// ============================================================================
// Sheet Classification (suggestions only)
// ============================================================================

struct SheetScore {
    std::string sheet;
    int incomeScore = 0;
    int balanceScore = 0;
    int cashFlowScore = 0;

    // Best-scoring type; ties resolve in enum order. Requires a non-zero score.
    std::optional<StatementType> bestType() const;
    int score(StatementType type) const;
};

// Keyword scores from the sheet name and the row labels of the first rows
SheetScore scoreSheet(const Sheet& sheet, int labelRows = 40);

using SheetSelection = std::map<StatementType, std::string>;

/**
 * @brief Propose a statement_type -> sheet mapping for user confirmation.
 *
 * Each sheet is proposed for at most one statement type. Types with no
 * scoring sheet are left out. The engine never routes on this output
 * without the caller passing it back as an explicit selection.
 */
SheetSelection suggestSheetSelection(const WorkbookModel& workbook);

}  // namespace finvar
