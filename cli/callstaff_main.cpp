///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cli_options.hpp"
#include "csv_input.hpp"
#include "errors.hpp"
#include "formatting.hpp"
#include "planner.hpp"
#include <exception>
#include <iostream>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Command-line entry point of the staffing planner.
 *
 * Reads the customer table, plans staffing with the requested utilization,
 * capacity and algorithm, prints the schedule to stdout and the metrics
 * summary to stderr, and stores the rendered schedule under results/.
 * Any error is reported on stderr with exit status 1.
 */
int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "callstaff";

    CliOptions options;
    try {
        options = parseCliArgs(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << usageText(program) << "\nError: " << e.what() << "\n";
        return 1;
    }

    if (options.showHelp) {
        std::cout << usageText(program);
        return 0;
    }

    try {
        std::vector<CustomerRequirement> customers = readCustomerCsv(options.inputPath);
        if (customers.empty()) {
            std::cerr << "Error: No valid records found in input file\n";
            return 1;
        }

        StaffingPlan plan = planStaffing(customers, options.plannerConfig());

        // Primary result on stdout, diagnostics on stderr.
        std::string rendered = formatPlan(plan, options.format);
        std::cout << rendered << "\n";

        printMetrics(std::cerr, plan);

        std::string fileName = resultFileName(currentTimestamp(), options.inputPath,
                                              options.utilization, options.capacity,
                                              options.algorithm, options.format);
        std::string written = writeResultFile(rendered, DEFAULT_RESULTS_DIR, fileName);
        std::cerr << "\nResult written to: " << written << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
