#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace finvar {

// ============================================================================
// Cell Values
// ============================================================================

struct EmptyValue {};

struct ErrorValue {
    std::string code;  // "#REF!", "#DIV/0!", ...
};

using CellValue = std::variant<EmptyValue, double, std::string, bool, ErrorValue>;

inline bool isEmptyValue(const CellValue& v) { return std::holds_alternative<EmptyValue>(v); }
inline bool isNumberValue(const CellValue& v) { return std::holds_alternative<double>(v); }
inline bool isTextValue(const CellValue& v) { return std::holds_alternative<std::string>(v); }

// Text rendering of a raw value (numbers without trailing zeros)
std::string valueToString(const CellValue& value);

// ============================================================================
// Cell
// ============================================================================

struct Cell {
    std::string sheet;
    int row = 0;                        // 1-based
    int col = 0;                        // 1-based
    CellValue rawValue;                 // Cached value as stored in the file
    std::optional<std::string> formula; // Formula text including the leading '='

    bool hasFormula() const { return formula.has_value() && !formula->empty(); }
    std::optional<double> numericValue() const;
    std::string address() const;        // "C14"
    std::string qualifiedAddress() const; // "IS!C14"
};

// ============================================================================
// Address Helpers
// ============================================================================

// 1 -> "A", 27 -> "AA"
std::string columnToLetters(int col);

// "A" -> 1, "aa" -> 27, invalid -> 0
int lettersToColumn(const std::string& letters);

// (row, col) -> "C14"
std::string cellAddress(int row, int col);

// "C14" or "$C$14" -> (row, col); nullopt if malformed
std::optional<std::pair<int, int>> parseCellAddress(const std::string& address);

// Quote a sheet name when needed: "My Sheet" -> "'My Sheet'"
std::string quoteSheetName(const std::string& sheet);

// ============================================================================
// Sheet
// ============================================================================

class Sheet {
public:
    explicit Sheet(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    // Builders (used while loading; the engine only sees const sheets)
    Cell& setValue(int row, int col, CellValue value);
    Cell& setFormula(int row, int col, const std::string& formula,
                     CellValue cachedValue = EmptyValue{});
    Cell& setValue(const std::string& address, CellValue value);
    Cell& setFormula(const std::string& address, const std::string& formula,
                     CellValue cachedValue = EmptyValue{});

    // Lookup; nullptr for cells never written
    const Cell* cell(int row, int col) const;
    const Cell* cell(const std::string& address) const;

    // Text of the first non-empty text cell in the row, scanning at most
    // maxColumns columns from the left
    std::optional<std::string> rowLabel(int row, int maxColumns = 5) const;

    int maxRow() const { return maxRow_; }
    int maxColumn() const { return maxCol_; }
    size_t cellCount() const { return cells_.size(); }

    // Row-major iteration
    const std::map<std::pair<int, int>, Cell>& cells() const { return cells_; }

private:
    std::string name_;
    std::map<std::pair<int, int>, Cell> cells_;  // (row, col) -> cell
    int maxRow_ = 0;
    int maxCol_ = 0;

    Cell& upsert(int row, int col);
};

// ============================================================================
// Workbook Model
// ============================================================================

class WorkbookModel {
public:
    WorkbookModel() = default;
    explicit WorkbookModel(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    Sheet& addSheet(const std::string& name);
    const Sheet* sheet(const std::string& name) const;
    Sheet* sheet(const std::string& name);
    std::vector<std::string> sheetNames() const;
    const std::vector<std::unique_ptr<Sheet>>& sheets() const { return sheets_; }

    // Defined names: "TaxRate" -> "Inputs!$B$2"
    void defineName(const std::string& name, const std::string& reference);
    std::optional<std::string> definedName(const std::string& name) const;
    const std::map<std::string, std::string>& definedNames() const { return definedNames_; }

    // Cross-sheet lookup
    const Cell* cell(const std::string& sheetName, int row, int col) const;

private:
    std::string name_;
    std::vector<std::unique_ptr<Sheet>> sheets_;
    std::map<std::string, std::string> definedNames_;  // upper-cased name -> reference
};

// ============================================================================
// JSON Loading
// ============================================================================

struct WorkbookLoadResult {
    bool success = false;
    std::shared_ptr<const WorkbookModel> workbook;
    std::string errorMessage;
};

// Parse the JSON workbook format:
// {"name": "...", "sheets": [{"name": "IS", "cells": [{"ref": "C5", "value": 1,
//   "formula": "=C3+C4"}], "rows": [[...], ...]}], "definedNames": {...}}
WorkbookLoadResult loadWorkbookFromJSON(const std::string& jsonText, const std::string& sourceName = "<input>");

// Read a file and parse it as a JSON workbook
WorkbookLoadResult loadWorkbookFile(const std::string& path);

// Read a file into a string
std::optional<std::string> readFile(const std::string& filepath);

}  // namespace finvar
