#include "finvar/workbook.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace finvar {

// ============================================================================
// Values
// ============================================================================

std::string valueToString(const CellValue& value) {
    if (std::holds_alternative<EmptyValue>(value)) return "";
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d && std::fabs(*d) < 1e15) {
            std::ostringstream ss;
            ss << static_cast<long long>(*d);
            return ss.str();
        }
        std::ostringstream ss;
        ss << std::setprecision(15) << *d;
        return ss.str();
    }
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "TRUE" : "FALSE";
    return std::get<ErrorValue>(value).code;
}

std::optional<double> Cell::numericValue() const {
    if (const auto* d = std::get_if<double>(&rawValue)) {
        if (std::isfinite(*d)) return *d;
    }
    return std::nullopt;
}

std::string Cell::address() const {
    return cellAddress(row, col);
}

std::string Cell::qualifiedAddress() const {
    return sheet + "!" + cellAddress(row, col);
}

// ============================================================================
// Address Helpers
// ============================================================================

std::string columnToLetters(int col) {
    std::string letters;
    while (col > 0) {
        int rem = (col - 1) % 26;
        letters.insert(letters.begin(), static_cast<char>('A' + rem));
        col = (col - 1) / 26;
    }
    return letters;
}

int lettersToColumn(const std::string& letters) {
    if (letters.empty() || letters.size() > 3) return 0;
    int col = 0;
    for (char c : letters) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return 0;
        col = col * 26 + (std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
    }
    return col;
}

std::string cellAddress(int row, int col) {
    return columnToLetters(col) + std::to_string(row);
}

std::optional<std::pair<int, int>> parseCellAddress(const std::string& address) {
    size_t i = 0;
    if (i < address.size() && address[i] == '$') ++i;
    size_t letterStart = i;
    while (i < address.size() && std::isalpha(static_cast<unsigned char>(address[i]))) ++i;
    std::string letters = address.substr(letterStart, i - letterStart);
    if (i < address.size() && address[i] == '$') ++i;
    size_t digitStart = i;
    while (i < address.size() && std::isdigit(static_cast<unsigned char>(address[i]))) ++i;
    if (i != address.size() || digitStart == i) return std::nullopt;

    int col = lettersToColumn(letters);
    if (col == 0) return std::nullopt;
    int row = 0;
    try {
        row = std::stoi(address.substr(digitStart));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (row <= 0) return std::nullopt;
    return std::make_pair(row, col);
}

std::string quoteSheetName(const std::string& sheet) {
    bool plain = !sheet.empty() && !std::isdigit(static_cast<unsigned char>(sheet[0]));
    for (char c : sheet) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            plain = false;
            break;
        }
    }
    if (plain) return sheet;
    std::string quoted = "'";
    for (char c : sheet) {
        quoted += c;
        if (c == '\'') quoted += '\'';
    }
    quoted += "'";
    return quoted;
}

// ============================================================================
// Sheet
// ============================================================================

Cell& Sheet::upsert(int row, int col) {
    if (row <= 0 || col <= 0) {
        throw std::out_of_range("cell index out of range on sheet '" + name_ + "': (" +
                                std::to_string(row) + ", " + std::to_string(col) + ")");
    }
    auto& c = cells_[{row, col}];
    c.sheet = name_;
    c.row = row;
    c.col = col;
    maxRow_ = std::max(maxRow_, row);
    maxCol_ = std::max(maxCol_, col);
    return c;
}

Cell& Sheet::setValue(int row, int col, CellValue value) {
    Cell& c = upsert(row, col);
    c.rawValue = std::move(value);
    c.formula.reset();
    return c;
}

Cell& Sheet::setFormula(int row, int col, const std::string& formula, CellValue cachedValue) {
    Cell& c = upsert(row, col);
    c.rawValue = std::move(cachedValue);
    c.formula = formula;
    return c;
}

Cell& Sheet::setValue(const std::string& address, CellValue value) {
    auto rc = parseCellAddress(address);
    if (!rc) throw std::invalid_argument("invalid cell address: " + address);
    return setValue(rc->first, rc->second, std::move(value));
}

Cell& Sheet::setFormula(const std::string& address, const std::string& formula, CellValue cachedValue) {
    auto rc = parseCellAddress(address);
    if (!rc) throw std::invalid_argument("invalid cell address: " + address);
    return setFormula(rc->first, rc->second, formula, std::move(cachedValue));
}

const Cell* Sheet::cell(int row, int col) const {
    auto it = cells_.find({row, col});
    return it == cells_.end() ? nullptr : &it->second;
}

const Cell* Sheet::cell(const std::string& address) const {
    auto rc = parseCellAddress(address);
    if (!rc) return nullptr;
    return cell(rc->first, rc->second);
}

std::optional<std::string> Sheet::rowLabel(int row, int maxColumns) const {
    for (int col = 1; col <= maxColumns; ++col) {
        const Cell* c = cell(row, col);
        if (!c) continue;
        if (const auto* s = std::get_if<std::string>(&c->rawValue)) {
            bool blank = std::all_of(s->begin(), s->end(),
                                     [](unsigned char ch) { return std::isspace(ch); });
            if (!blank) return *s;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Workbook Model
// ============================================================================

namespace {

std::string toUpper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

}  // namespace

Sheet& WorkbookModel::addSheet(const std::string& name) {
    if (Sheet* existing = sheet(name)) {
        return *existing;
    }
    sheets_.push_back(std::make_unique<Sheet>(name));
    return *sheets_.back();
}

const Sheet* WorkbookModel::sheet(const std::string& name) const {
    for (const auto& s : sheets_) {
        if (s->name() == name) return s.get();
    }
    // Sheet names are case-insensitive in formulas
    std::string upper = toUpper(name);
    for (const auto& s : sheets_) {
        if (toUpper(s->name()) == upper) return s.get();
    }
    return nullptr;
}

Sheet* WorkbookModel::sheet(const std::string& name) {
    return const_cast<Sheet*>(static_cast<const WorkbookModel*>(this)->sheet(name));
}

std::vector<std::string> WorkbookModel::sheetNames() const {
    std::vector<std::string> names;
    names.reserve(sheets_.size());
    for (const auto& s : sheets_) names.push_back(s->name());
    return names;
}

void WorkbookModel::defineName(const std::string& name, const std::string& reference) {
    std::string ref = reference;
    if (!ref.empty() && ref[0] == '=') ref.erase(0, 1);
    definedNames_[toUpper(name)] = ref;
}

std::optional<std::string> WorkbookModel::definedName(const std::string& name) const {
    auto it = definedNames_.find(toUpper(name));
    if (it == definedNames_.end()) return std::nullopt;
    return it->second;
}

const Cell* WorkbookModel::cell(const std::string& sheetName, int row, int col) const {
    const Sheet* s = sheet(sheetName);
    return s ? s->cell(row, col) : nullptr;
}

// ============================================================================
// JSON Loading
// ============================================================================

namespace {

const std::set<std::string> kErrorCodes = {
    "#NULL!", "#DIV/0!", "#VALUE!", "#REF!", "#NAME?", "#NUM!", "#N/A", "#GETTING_DATA", "#SPILL!", "#CALC!"
};

CellValue valueFromJSON(const json& v) {
    if (v.is_null()) return EmptyValue{};
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        if (kErrorCodes.count(toUpper(s))) return ErrorValue{toUpper(s)};
        if (s.empty()) return EmptyValue{};
        return s;
    }
    if (v.is_object() && v.contains("error")) {
        return ErrorValue{v.at("error").get<std::string>()};
    }
    throw std::invalid_argument("unsupported cell value: " + v.dump());
}

void loadSheet(const json& js, WorkbookModel& workbook) {
    std::string name = js.at("name").get<std::string>();
    if (workbook.sheet(name)) {
        throw std::invalid_argument("duplicate sheet name '" + name + "'");
    }
    Sheet& sheet = workbook.addSheet(name);

    // Dense grid: rows[r][c] is cell (r + 1, c + 1); strings starting with '='
    // are formulas without a cached value
    if (js.contains("rows")) {
        const auto& rows = js.at("rows");
        for (size_t r = 0; r < rows.size(); ++r) {
            const auto& row = rows[r];
            if (row.is_null()) continue;
            for (size_t c = 0; c < row.size(); ++c) {
                const auto& v = row[c];
                if (v.is_null()) continue;
                int ri = static_cast<int>(r) + 1;
                int ci = static_cast<int>(c) + 1;
                if (v.is_string()) {
                    const std::string s = v.get<std::string>();
                    if (s.size() > 1 && s[0] == '=') {
                        sheet.setFormula(ri, ci, s);
                        continue;
                    }
                }
                CellValue value = valueFromJSON(v);
                if (!isEmptyValue(value)) sheet.setValue(ri, ci, std::move(value));
            }
        }
    }

    // Sparse cells override the grid
    if (js.contains("cells")) {
        for (const auto& jc : js.at("cells")) {
            std::string ref = jc.at("ref").get<std::string>();
            CellValue value = jc.contains("value") ? valueFromJSON(jc.at("value")) : CellValue(EmptyValue{});
            if (jc.contains("formula") && !jc.at("formula").is_null()) {
                std::string formula = jc.at("formula").get<std::string>();
                if (!formula.empty() && formula[0] != '=') formula = "=" + formula;
                sheet.setFormula(ref, formula, std::move(value));
            } else {
                sheet.setValue(ref, std::move(value));
            }
        }
    }
}

}  // namespace

WorkbookLoadResult loadWorkbookFromJSON(const std::string& jsonText, const std::string& sourceName) {
    WorkbookLoadResult result;
    try {
        json j = json::parse(jsonText);
        if (!j.is_object()) {
            result.errorMessage = sourceName + ": top-level value must be an object";
            return result;
        }

        auto workbook = std::make_shared<WorkbookModel>(j.value("name", sourceName));
        if (!j.contains("sheets") || !j.at("sheets").is_array()) {
            result.errorMessage = sourceName + ": missing 'sheets' array";
            return result;
        }
        for (const auto& js : j.at("sheets")) {
            loadSheet(js, *workbook);
        }
        if (j.contains("definedNames")) {
            for (const auto& [name, ref] : j.at("definedNames").items()) {
                workbook->defineName(name, ref.get<std::string>());
            }
        }

        result.workbook = workbook;
        result.success = true;
    } catch (const json::exception& e) {
        result.errorMessage = sourceName + ": " + e.what();
    } catch (const std::exception& e) {
        result.errorMessage = sourceName + ": " + e.what();
    }
    return result;
}

WorkbookLoadResult loadWorkbookFile(const std::string& path) {
    auto text = readFile(path);
    if (!text) {
        WorkbookLoadResult result;
        result.errorMessage = "Could not open file: " + path;
        return result;
    }
    return loadWorkbookFromJSON(*text, path);
}

std::optional<std::string> readFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace finvar
