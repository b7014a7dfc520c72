/**
 * finvar.conf parsing and its effect on the engine components.
 */

#include <catch2/catch_test_macros.hpp>
#include "finvar/matcher.h"
#include "finvar/options.h"
#include "finvar/variance_engine.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace finvar;

namespace {

// Writes a config file for the lifetime of the object
class ScratchConfig {
public:
    ScratchConfig(const std::string& name, const std::string& text)
        : path_(fs::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << text;
    }
    ~ScratchConfig() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

EngineOptions loadOrFail(const ScratchConfig& config) {
    EngineOptions options;
    REQUIRE(loadEngineOptionsFromFile(config.path(), options));
    return options;
}

}  // namespace

TEST_CASE("Shipped finvar.conf keeps the defaults", "[config]") {
    const char* env = std::getenv("FINVAR_EXAMPLES_DIR");
    fs::path conf = fs::path(env && env[0] != '\0' ? env : "../examples") / "finvar.conf";
    if (!fs::exists(conf)) {
        SKIP("finvar.conf not found: " << conf.string());
    }

    EngineOptions defaults;
    EngineOptions options;
    options.threads = 3;  // Untouched by a file of comments
    REQUIRE(loadEngineOptionsFromFile(conf.string(), options));
    REQUIRE(options.threads == 3);
    REQUIRE(options.headerScanRows == defaults.headerScanRows);
    REQUIRE(options.maxConsecutiveEmptyRows == defaults.maxConsecutiveEmptyRows);
    REQUIRE(options.fuzzyThreshold == defaults.fuzzyThreshold);
    REQUIRE(options.drillDownTimeoutMs == defaults.drillDownTimeoutMs);
}

TEST_CASE("Option file parsing", "[config]") {
    SECTION("Unreadable path") {
        EngineOptions options;
        REQUIRE_FALSE(loadEngineOptionsFromFile("/nonexistent/dir/finvar.conf", options));
        REQUIRE(options.maxGraphDepth == EngineOptions().maxGraphDepth);
    }

    SECTION("Every detection and drill-down key") {
        ScratchConfig config("finvar_keys.conf",
            "headerScanRows=15\n"
            "  minPeriodMatches = 2  \n"
            "numericYearHeaders = off\n"
            "yearMin = 2000\n"
            "yearMax = 2030\n"
            "maxConsecutiveEmptyRows = 4\n"
            "labelScanColumns = 2\n"
            "maxGraphNodes = 500\n"
            "maxRangeCells = 64\n"
            "drillDownTimeoutMs = 0\n");
        auto options = loadOrFail(config);
        REQUIRE(options.headerScanRows == 15);
        REQUIRE(options.minPeriodMatches == 2);
        REQUIRE_FALSE(options.numericYearHeaders);
        REQUIRE(options.yearMin == 2000);
        REQUIRE(options.yearMax == 2030);
        REQUIRE(options.maxConsecutiveEmptyRows == 4);
        REQUIRE(options.labelScanColumns == 2);
        REQUIRE(options.maxGraphNodes == 500);
        REQUIRE(options.maxRangeCells == 64);
        REQUIRE(options.drillDownTimeoutMs == 0);
    }

    SECTION("Trailing comments and boolean spellings") {
        ScratchConfig config("finvar_comments.conf",
            "# thresholds\n"
            "fuzzyThreshold = 0.9   # stricter\n"
            "varianceThreshold = 0.05\n"
            "failOnDepthExceeded = YES\n"
            "verbose = 1\n");
        auto options = loadOrFail(config);
        REQUIRE(options.fuzzyThreshold == 0.9);
        REQUIRE(options.varianceThreshold == 0.05);
        REQUIRE(options.failOnDepthExceeded);
        REQUIRE(options.verbose);
    }

    SECTION("Malformed lines leave the defaults") {
        ScratchConfig config("finvar_bad.conf",
            "no equals sign here\n"
            "unknownKey = 3\n"
            "maxGraphDepth = deep\n"
            "verbose = maybe\n"
            "threads = 4\n");
        auto options = loadOrFail(config);
        REQUIRE(options.maxGraphDepth == 64);
        REQUIRE_FALSE(options.verbose);
        REQUIRE(options.threads == 4);
    }
}

TEST_CASE("Loaded options drive the engine", "[config]") {
    ScratchConfig config("finvar_engine.conf",
        "fuzzyThreshold = 0.99\n"
        "varianceThreshold = 0.5\n");
    auto options = loadOrFail(config);

    LineItem oldItem;
    oldItem.name = "Total Revenue";
    LineItem newItem;
    newItem.name = "Total Revenues";

    REQUIRE(LineItemMatcher().match({oldItem}, {newItem}).fuzzyCount == 1);
    auto match = LineItemMatcher(options).match({oldItem}, {newItem});
    REQUIRE(match.fuzzyCount == 0);
    REQUIRE(match.oldOnlyCount == 1);
    REQUIRE(match.newOnlyCount == 1);

    VarianceResult r;
    r.oldValue = 100.0;
    r.newValue = 140.0;
    VarianceEngine(options).fillVariance(r);
    REQUIRE_FALSE(r.significant);
    VarianceEngine(EngineOptions()).fillVariance(r);
    REQUIRE(r.significant);
}
