#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <istream>
#include <string>
#include <vector>


///////////////////////////
///       COLUMNS       ///
///////////////////////////
/**
 * @brief Header names of the customer input table.
 */
namespace CsvColumns {
static const char* const CUSTOMER_NAME = "CustomerName";
static const char* const AVG_CALL_DURATION_SECONDS = "AverageCallDurationSeconds";
static const char* const START_TIME = "StartTimePT";
static const char* const END_TIME = "EndTimePT";
static const char* const NUMBER_OF_CALLS = "NumberOfCalls";
static const char* const PRIORITY = "Priority";
}

/// Every column a customer table must declare in its header.
const std::vector<std::string>& requiredCsvColumns();


///////////////////////////
///       PARSING       ///
///////////////////////////
/**
 * @brief Convert a 12-hour clock label ("9AM", "12pm", " 7PM ") to an hour
 *        bucket 0-23.
 *
 * 12AM is midnight (0) and 12PM is noon (12).
 *
 * @throws InputError if the label is empty, lacks AM/PM, or the hour is not
 *         an integer in 1-12.
 */
int parseTimeOfDay(const std::string& label);

/**
 * @brief Split one CSV line into trimmed fields.
 *
 * Fields may be enclosed in double quotes, in which case they can contain
 * commas, and "" stands for a literal quote.
 */
std::vector<std::string> splitCsvLine(const std::string& line);

/**
 * @brief Read and validate a customer table.
 *
 * Blank lines are skipped. Every other row must have exactly one value per
 * header column and satisfy the customer contract (non-empty name, positive
 * duration, end after start, non-negative integer call count, priority 1-5,
 * total load within MAX_AGENT_LOAD agent-hours).
 *
 * @throws InputError naming the offending row (header = row 1) and column.
 */
std::vector<CustomerRequirement> parseCustomerCsv(std::istream& in);

/**
 * @brief Open @p path and parse it with parseCustomerCsv().
 *
 * @throws InputError if the file cannot be opened or is malformed.
 */
std::vector<CustomerRequirement> readCustomerCsv(const std::string& path);
