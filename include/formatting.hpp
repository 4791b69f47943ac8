#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "planner.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>


///////////////////////////
///       FORMATS       ///
///////////////////////////
/**
 * @brief Encodings the schedule can be rendered in.
 */
enum class OutputFormat { TEXT, JSON, CSV };

/**
 * @brief Parse "text", "json" or "csv".
 *
 * @throws ConfigurationError for any other name.
 */
OutputFormat parseOutputFormat(const std::string& name);

/// File extension (without dot) used for result files of a format.
std::string formatExtension(OutputFormat format);


///////////////////////////
///      RENDERING      ///
///////////////////////////
/**
 * @brief "HH:00" label of an hour bucket.
 */
std::string hourLabel(int hour);

/**
 * @brief One line per hour: "09:00 : total=3 ; A=2, B=1".
 *
 * In capacity mode, hours with unserved demand get " | unmet: A=4".
 */
std::string formatText(const StaffingPlan& plan);

/**
 * @brief JSON array with one object per hour (hour, total_agents,
 *        customers and, when non-empty, unmet_demand).
 */
std::string formatJson(const StaffingPlan& plan);

/**
 * @brief CSV with columns hour,total_agents,customers,unmet_demand.
 */
std::string formatCsv(const StaffingPlan& plan);

/// Dispatch to the renderer for @p format.
std::string formatPlan(const StaffingPlan& plan, OutputFormat format);


///////////////////////////
///       METRICS       ///
///////////////////////////
/**
 * @brief Print the run summary: volume, agent-hours, peak, per-customer
 *        service, unmet demand by hour and, for the shift policy, the
 *        first call moves.
 */
void printMetrics(std::ostream& out, const StaffingPlan& plan);


///////////////////////////
///     RESULT FILE     ///
///////////////////////////
/**
 * @brief Compact utilization label: two decimals, trailing zeros dropped
 *        (1.0 -> "1", 0.85 -> "0.85", 0.5 -> "0.5").
 */
std::string utilizationLabel(double utilization);

/**
 * @brief Result file name for a run.
 *
 * {timestamp}_{inputStem}_util{U}[_cap{K}][_{algorithm}]_RESULT.{ext}; the
 * algorithm is only named when capacity is set and it is not greedy.
 */
std::string resultFileName(const std::string& timestamp,
                           const std::string& inputPath,
                           double utilization,
                           std::optional<int> capacity,
                           Algorithm algorithm,
                           OutputFormat format);

/// Local time formatted as YYYYmmdd_HHMMSS.
std::string currentTimestamp();

/**
 * @brief Write @p content to @p directory / @p fileName, creating the
 *        directory if needed.
 *
 * @return The path written.
 * @throws std::runtime_error if the file cannot be written.
 */
std::string writeResultFile(const std::string& content,
                            const std::string& directory,
                            const std::string& fileName);
