#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "planner.hpp"
#include "formatting.hpp"
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///       OPTIONS       ///
///////////////////////////
/// Directory result files are written to, relative to the working directory.
static const char* const DEFAULT_RESULTS_DIR = "results";

/**
 * @brief Parsed and validated command line of the callstaff tool.
 */
struct CliOptions {
    std::string inputPath; ///< CSV file with customer requirements.
    double utilization = 1.0; ///< Agent utilization factor, 0 < u <= 1.
    OutputFormat format = OutputFormat::TEXT; ///< Rendering of the schedule.
    std::optional<int> capacity; ///< Per-hour agent ceiling, if any.
    Algorithm algorithm = Algorithm::GREEDY; ///< Allocation policy with a ceiling.
    bool showHelp = false; ///< --help was requested; nothing else is valid.

    /// Planner configuration derived from these options.
    PlannerConfig plannerConfig() const;
};

/**
 * @brief Parse command-line arguments (argv[0] excluded).
 *
 * Options: --input/-i PATH (required), --utilization/-u U,
 * --format/-f text|json|csv, --capacity/-c K, --algorithm/-a greedy|shift,
 * --help/-h. Long options also accept the --name=value form.
 *
 * @throws ConfigurationError on unknown options, missing or invalid values.
 */
CliOptions parseCliArgs(const std::vector<std::string>& args);

/// Same as above, taking main()'s arguments.
CliOptions parseCliArgs(int argc, char** argv);

/// Usage text printed for --help and after usage errors.
std::string usageText(const std::string& programName);
