#include "finvar/analyzer.h"
#include "finvar/options.h"
#include "finvar/report.h"
#include "finvar/session.h"
#include "finvar/sheet_classifier.h"
#include "finvar/workbook.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <old.json> <new.json>\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -s, --sheet <type=sheet>    Map a statement type to a sheet (repeatable)\n";
    std::cerr << "                              type: income_statement|is, balance_sheet|bs, cash_flow|cf\n";
    std::cerr << "                              Use type=old_sheet:new_sheet when the names differ\n";
    std::cerr << "  -p, --period <label>        Period to compare (default: latest common period)\n";
    std::cerr << "  -D, --drill-down <item>     Attribute the variance of a line item to its formula inputs\n";
    std::cerr << "  -t, --templates <file>      Period templates (JSON array)\n";
    std::cerr << "  -c, --config <file>         Engine options file (key = value)\n";
    std::cerr << "  -f, --format <format>       Output format: json, table (default: json)\n";
    std::cerr << "  -o, --output <file>         Output file (default: stdout)\n";
    std::cerr << "  --probe                     Print detected periods and line items of the selected sheets\n";
    std::cerr << "  --suggest                   Print a suggested sheet selection for both workbooks\n";
    std::cerr << "  --preview <formula>         Print the complexity preview of a formula\n";
    std::cerr << "  --timing                    Include stage timings in the JSON report\n";
    std::cerr << "  -v, --verbose               Trace pipeline progress on stderr\n";
    std::cerr << "  -h, --help                  Show this help message\n";
}

// "is=Income" or "is=P&L:Income Statement"
bool parseSelectionArg(const std::string& arg, finvar::SheetSelection& oldSel,
                       finvar::SheetSelection& newSel) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= arg.size()) return false;
    auto type = finvar::parseStatementType(arg.substr(0, eq));
    if (!type) return false;

    std::string sheets = arg.substr(eq + 1);
    auto colon = sheets.find(':');
    if (colon == std::string::npos) {
        oldSel[*type] = sheets;
        newSel[*type] = sheets;
    } else {
        oldSel[*type] = sheets.substr(0, colon);
        newSel[*type] = sheets.substr(colon + 1);
    }
    return !oldSel[*type].empty() && !newSel[*type].empty();
}

int main(int argc, char* argv[]) {
    std::vector<std::string> inputFiles;
    std::string outputFile;
    std::string configFile;
    std::string templatesFile;
    std::string period;
    std::string drillDownItem;
    std::string previewFormula;
    std::string format = "json";
    bool probe = false;
    bool suggest = false;
    bool timing = false;
    bool verbose = false;
    finvar::SheetSelection oldSelection;
    finvar::SheetSelection newSelection;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--probe") {
            probe = true;
        } else if (arg == "--suggest") {
            suggest = true;
        } else if (arg == "--timing") {
            timing = true;
        } else if (arg == "-s" || arg == "--sheet") {
            if (i + 1 < argc) {
                if (!parseSelectionArg(argv[++i], oldSelection, newSelection)) {
                    std::cerr << "Error: invalid sheet selection '" << argv[i] << "' (expected type=sheet)\n";
                    return 1;
                }
            } else {
                std::cerr << "Error: -s requires an argument\n";
                return 1;
            }
        } else if (arg == "-p" || arg == "--period") {
            if (i + 1 < argc) {
                period = argv[++i];
            } else {
                std::cerr << "Error: -p requires an argument\n";
                return 1;
            }
        } else if (arg == "-D" || arg == "--drill-down") {
            if (i + 1 < argc) {
                drillDownItem = argv[++i];
            } else {
                std::cerr << "Error: -D requires an argument\n";
                return 1;
            }
        } else if (arg == "-t" || arg == "--templates") {
            if (i + 1 < argc) {
                templatesFile = argv[++i];
            } else {
                std::cerr << "Error: -t requires an argument\n";
                return 1;
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: -c requires an argument\n";
                return 1;
            }
        } else if (arg == "-f" || arg == "--format") {
            if (i + 1 < argc) {
                format = argv[++i];
            } else {
                std::cerr << "Error: -f requires an argument\n";
                return 1;
            }
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                outputFile = argv[++i];
            } else {
                std::cerr << "Error: -o requires an argument\n";
                return 1;
            }
        } else if (arg == "--preview") {
            if (i + 1 < argc) {
                previewFormula = argv[++i];
            } else {
                std::cerr << "Error: --preview requires an argument\n";
                return 1;
            }
        } else if (arg[0] != '-') {
            inputFiles.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (format != "json" && format != "table") {
        std::cerr << "Unknown format: " << format << "\n";
        return 1;
    }

    std::string output;
    bool success = true;

    if (!previewFormula.empty()) {
        output = finvar::generateComplexityJSON(finvar::analyzeFormulaComplexity(previewFormula));
    } else {
        if (inputFiles.size() != 2) {
            std::cerr << "Error: expected an old and a new workbook\n";
            printUsage(argv[0]);
            return 1;
        }

        finvar::EngineOptions options;
        if (!configFile.empty() && !finvar::loadEngineOptionsFromFile(configFile, options)) {
            std::cerr << "Error: Could not read config file: " << configFile << "\n";
            return 1;
        }
        if (verbose) options.verbose = true;

        std::vector<finvar::PeriodTemplate> templates;
        if (!templatesFile.empty()) {
            auto text = finvar::readFile(templatesFile);
            if (!text) {
                std::cerr << "Error: Could not read templates file: " << templatesFile << "\n";
                return 1;
            }
            std::string error;
            auto loaded = finvar::loadPeriodTemplatesJSON(*text, error);
            if (!loaded) {
                std::cerr << "Error: " << templatesFile << ": " << error << "\n";
                return 1;
            }
            templates = *loaded;
        }

        auto oldLoad = finvar::loadWorkbookFile(inputFiles[0]);
        if (!oldLoad.success) {
            std::cerr << "Error: " << oldLoad.errorMessage << "\n";
            return 1;
        }
        auto newLoad = finvar::loadWorkbookFile(inputFiles[1]);
        if (!newLoad.success) {
            std::cerr << "Error: " << newLoad.errorMessage << "\n";
            return 1;
        }

        if (suggest) {
            auto oldSuggestion = finvar::suggestSheetSelection(*oldLoad.workbook);
            auto newSuggestion = finvar::suggestSheetSelection(*newLoad.workbook);
            if (format == "json") {
                output = "{\n\"old\": " + finvar::generateSelectionJSON(oldSuggestion) +
                         ",\n\"new\": " + finvar::generateSelectionJSON(newSuggestion) + "\n}\n";
            } else {
                for (const auto& [label, selection] :
                     {std::make_pair(std::string("old"), oldSuggestion),
                      std::make_pair(std::string("new"), newSuggestion)}) {
                    output += label + ":\n";
                    for (const auto& [type, sheet] : selection) {
                        output += "  " + finvar::statementTypeToString(type) + " = " + sheet + "\n";
                    }
                }
            }
        } else if (oldSelection.empty()) {
            std::cerr << "Error: no sheet selection; pass -s type=sheet (see --suggest)\n";
            return 1;
        } else if (probe) {
            finvar::VarianceAnalyzer analyzer(oldLoad.workbook, newLoad.workbook, options);
            analyzer.setPeriodTemplates(templates);
            for (const auto& [type, sheet] : oldSelection) {
                auto oldStructure = analyzer.probeSheet(finvar::ModelSide::Old, sheet, type);
                auto newStructure = analyzer.probeSheet(finvar::ModelSide::New, newSelection[type], type);
                for (const auto* s : {&oldStructure, &newStructure}) {
                    if (format == "json") {
                        output += finvar::generateStructureJSON(*s) + "\n";
                    } else {
                        output += finvar::sideToString(s->side) + " " + s->sheet + ": " +
                                  std::to_string(s->periods.periods.size()) + " periods, " +
                                  std::to_string(s->extraction.items.size()) + " line items\n";
                        for (const auto& t : s->templateSuggestions) {
                            output += "  suggested template " + t.pattern + " (" + t.type + ", e.g. " +
                                      t.example + ")\n";
                        }
                        output += finvar::formatFindings(s->findings);
                    }
                    success = success && s->success;
                }
            }
        } else {
            finvar::DrillDownCache cache;
            finvar::AnalysisSession session("cli", oldLoad.workbook, newLoad.workbook, cache, options);
            session.setPeriodTemplates(templates);
            session.selectSheets(oldSelection, newSelection);
            session.selectPeriod(period);

            const auto& report = session.report();
            success = report.success;

            if (drillDownItem.empty()) {
                output = format == "json" ? finvar::generateVarianceJSON(report, timing) + "\n"
                                          : finvar::generateVarianceTable(report);
            } else {
                // First statement holding the item
                std::shared_ptr<const finvar::DrillDownResult> result;
                for (const auto& statement : report.statements) {
                    if (!statement.findPair(drillDownItem)) continue;
                    result = session.drillDown(statement.statementType, drillDownItem);
                    break;
                }
                if (!result) {
                    std::cerr << "Error: no line item '" << drillDownItem << "' in the analysed statements\n";
                    return 1;
                }
                output = format == "json" ? finvar::generateDrillDownJSON(*result) + "\n"
                                          : finvar::generateDrillDownTable(*result);
                success = result->success();
            }
        }
    }

    // Write output
    if (!outputFile.empty()) {
        std::ofstream file(outputFile);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open output file: " << outputFile << "\n";
            return 1;
        }
        file << output;
    } else {
        std::cout << output;
    }

    return success ? 0 : 1;
}
