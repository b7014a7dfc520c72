#include "finvar/options.h"
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace finvar {

namespace {

void trim(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(0, 1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
}

bool parseBool(const std::string& value) {
    std::string v;
    for (char c : value) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::invalid_argument("expected a boolean");
}

}  // namespace

bool loadEngineOptionsFromFile(const std::string& path, EngineOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;

        // Remove comments
        size_t commentPos = line.find('#');
        if (commentPos != std::string::npos) {
            line = line.substr(0, commentPos);
        }
        trim(line);
        if (line.empty()) continue;

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            std::cerr << "Warning: " << path << ":" << lineNumber << ": expected key = value\n";
            continue;
        }

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);

        try {
            if (key == "headerScanRows") options.headerScanRows = std::stoi(value);
            else if (key == "minPeriodMatches") options.minPeriodMatches = std::stoi(value);
            else if (key == "numericYearHeaders") options.numericYearHeaders = parseBool(value);
            else if (key == "yearMin") options.yearMin = std::stoi(value);
            else if (key == "yearMax") options.yearMax = std::stoi(value);
            else if (key == "maxConsecutiveEmptyRows") options.maxConsecutiveEmptyRows = std::stoi(value);
            else if (key == "labelScanColumns") options.labelScanColumns = std::stoi(value);
            else if (key == "fuzzyThreshold") options.fuzzyThreshold = std::stod(value);
            else if (key == "maxGraphDepth") options.maxGraphDepth = std::stoi(value);
            else if (key == "maxGraphNodes") options.maxGraphNodes = std::stoi(value);
            else if (key == "maxRangeCells") options.maxRangeCells = std::stoi(value);
            else if (key == "drillDownTimeoutMs") options.drillDownTimeoutMs = std::stoi(value);
            else if (key == "failOnDepthExceeded") options.failOnDepthExceeded = parseBool(value);
            else if (key == "varianceThreshold") options.varianceThreshold = std::stod(value);
            else if (key == "threads") options.threads = std::stoi(value);
            else if (key == "verbose") options.verbose = parseBool(value);
            else {
                std::cerr << "Warning: " << path << ":" << lineNumber << ": unknown option '" << key << "'\n";
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: " << path << ":" << lineNumber << ": invalid value for '"
                      << key << "': " << value << "\n";
        }
    }
    return true;
}

}  // namespace finvar
