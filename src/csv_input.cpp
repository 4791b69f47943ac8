///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "csv_input.hpp"
#include "baseline.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace((unsigned char)s[begin])) ++begin;
    size_t end = s.size();
    while (end > begin && std::isspace((unsigned char)s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

static std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return (char)std::toupper(ch); });
    return s;
}

static bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char ch) { return std::isspace(ch); });
}

/**
 * @brief Parse a whole string as a base-10 integer.
 *
 * @return false if anything other than an optional sign and digits is present.
 */
static bool parseInteger(const std::string& text, long long& value) {
    if (text.empty()) return false;
    size_t i = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (i == text.size()) return false;
    for (size_t k = i; k < text.size(); ++k) {
        if (!std::isdigit((unsigned char)text[k])) return false;
    }
    std::istringstream iss(text);
    iss >> value;
    return !iss.fail();
}

/**
 * @brief Parse a whole string as a finite real number.
 */
static bool parseReal(const std::string& text, double& value) {
    if (text.empty()) return false;
    std::istringstream iss(text);
    iss >> value;
    if (iss.fail()) return false;
    iss >> std::ws;
    return iss.eof() && std::isfinite(value);
}

/**
 * @brief Build the "Error parsing row N: ..." failure.
 */
static InputError rowError(int rowNumber, const std::string& message) {
    std::ostringstream ss;
    ss << "Error parsing row " << rowNumber << ": " << message;
    return InputError(ss.str());
}

static int parseIntegerField(const std::string& text, const char* column, int rowNumber) {
    long long value = 0;
    if (!parseInteger(text, value) || value < -2147483647LL || value > 2147483647LL) {
        throw rowError(rowNumber, std::string(column) + " must be an integer, got '" + text + "'");
    }
    return (int)value;
}


///////////////////////////
///       COLUMNS       ///
///////////////////////////
const std::vector<std::string>& requiredCsvColumns() {
    static const std::vector<std::string> kColumns = {
            CsvColumns::CUSTOMER_NAME,
            CsvColumns::AVG_CALL_DURATION_SECONDS,
            CsvColumns::START_TIME,
            CsvColumns::END_TIME,
            CsvColumns::NUMBER_OF_CALLS,
            CsvColumns::PRIORITY
    };
    return kColumns;
}


///////////////////////////
///       PARSING       ///
///////////////////////////
int parseTimeOfDay(const std::string& label) {
    std::string text = toUpper(trim(label));
    if (text.empty()) {
        throw InputError("Empty time string");
    }

    bool pm = false;
    if (text.size() >= 2 && text.compare(text.size() - 2, 2, "AM") == 0) {
        pm = false;
    } else if (text.size() >= 2 && text.compare(text.size() - 2, 2, "PM") == 0) {
        pm = true;
    } else {
        throw InputError("Invalid time format: " + text + ". Expected format like '9AM' or '7PM'");
    }

    std::string hourText = trim(text.substr(0, text.size() - 2));
    long long hour = 0;
    if (!parseInteger(hourText, hour)) {
        throw InputError("Invalid hour in time: " + text);
    }
    if (hour < 1 || hour > 12) {
        std::ostringstream ss;
        ss << "Hour must be 1-12, got: " << hour;
        throw InputError(ss.str());
    }

    // 12AM is midnight, 12PM is noon.
    if (!pm) return hour == 12 ? 0 : (int)hour;
    return hour == 12 ? 12 : (int)hour + 12;
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current += ch;
            }
        } else if (ch == '"') {
            inQuotes = true;
        } else if (ch == ',') {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current += ch;
        }
    }
    fields.push_back(trim(current));
    return fields;
}

/**
 * @brief Validate the header, then turn each non-blank row into a requirement.
 */
std::vector<CustomerRequirement> parseCustomerCsv(std::istream& in) {
    std::string line;
    int rowNumber = 0;

    // Header: first non-blank line.
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        ++rowNumber;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (rowNumber == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
        if (isBlank(line)) continue;
        header = splitCsvLine(line);
        break;
    }
    if (header.empty()) {
        throw InputError("CSV file is empty or has no header row");
    }

    std::map<std::string, int> columnIndex;
    for (int i = 0; i < (int)header.size(); ++i) {
        if (!header[i].empty()) columnIndex.emplace(header[i], i);
    }

    std::vector<std::string> missing;
    for (const std::string& col : requiredCsvColumns()) {
        if (columnIndex.find(col) == columnIndex.end()) missing.push_back(col);
    }
    if (!missing.empty()) {
        std::string list;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) list += ", ";
            list += missing[i];
        }
        throw InputError("CSV header is missing required column(s): " + list);
    }

    std::vector<CustomerRequirement> records;
    std::map<std::string, int> seenNames;
    while (std::getline(in, line)) {
        ++rowNumber;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (isBlank(line)) continue;

        std::vector<std::string> values = splitCsvLine(line);
        if (values.size() > header.size()) {
            throw rowError(rowNumber, "row has more columns than expected");
        }
        if (values.size() < header.size()) {
            std::string list;
            for (size_t i = values.size(); i < header.size(); ++i) {
                if (i > values.size()) list += ", ";
                list += header[i];
            }
            throw rowError(rowNumber, "row is missing value(s) for column(s): " + list);
        }

        auto field = [&](const char* column) -> const std::string& {
            return values[columnIndex.at(column)];
        };

        CustomerRequirement req;

        req.name = field(CsvColumns::CUSTOMER_NAME);
        if (req.name.empty()) {
            throw rowError(rowNumber, std::string(CsvColumns::CUSTOMER_NAME) + " is required");
        }
        auto seen = seenNames.emplace(req.name, rowNumber);
        if (!seen.second) {
            std::ostringstream ss;
            ss << "duplicate " << CsvColumns::CUSTOMER_NAME << " '" << req.name
               << "' (first seen on row " << seen.first->second << ")";
            throw rowError(rowNumber, ss.str());
        }

        const std::string& durationText = field(CsvColumns::AVG_CALL_DURATION_SECONDS);
        if (!parseReal(durationText, req.avgDurationSeconds)) {
            throw rowError(rowNumber, std::string(CsvColumns::AVG_CALL_DURATION_SECONDS)
                                      + " must be a number, got '" + durationText + "'");
        }
        if (req.avgDurationSeconds <= 0.0) {
            throw rowError(rowNumber, std::string(CsvColumns::AVG_CALL_DURATION_SECONDS) + " must be positive");
        }

        const std::string& startText = field(CsvColumns::START_TIME);
        const std::string& endText = field(CsvColumns::END_TIME);
        try {
            req.startHour = parseTimeOfDay(startText);
            req.endHour = parseTimeOfDay(endText);
        } catch (const InputError& e) {
            throw rowError(rowNumber, e.what());
        }
        if (req.endHour <= req.startHour) {
            throw rowError(rowNumber, std::string(CsvColumns::END_TIME) + " (" + endText + ") must be after "
                                      + CsvColumns::START_TIME + " (" + startText + ")");
        }

        req.totalCalls = parseIntegerField(field(CsvColumns::NUMBER_OF_CALLS), CsvColumns::NUMBER_OF_CALLS, rowNumber);
        if (req.totalCalls < 0) {
            throw rowError(rowNumber, std::string(CsvColumns::NUMBER_OF_CALLS) + " cannot be negative");
        }

        // Full utilization is the most lenient case; the planner re-checks
        // with the run's actual utilization.
        double load = agentLoad(req.totalCalls, req.avgDurationSeconds, 1.0);
        if (load > MAX_AGENT_LOAD) {
            std::ostringstream ss;
            ss << CsvColumns::NUMBER_OF_CALLS << " x " << CsvColumns::AVG_CALL_DURATION_SECONDS
               << " needs " << load << " agent-hours, more than the supported " << MAX_AGENT_LOAD;
            throw rowError(rowNumber, ss.str());
        }

        req.priority = parseIntegerField(field(CsvColumns::PRIORITY), CsvColumns::PRIORITY, rowNumber);
        if (req.priority < HIGHEST_PRIORITY || req.priority > LOWEST_PRIORITY) {
            std::ostringstream ss;
            ss << CsvColumns::PRIORITY << " must be " << HIGHEST_PRIORITY << "-" << LOWEST_PRIORITY
               << ", got: " << req.priority;
            throw rowError(rowNumber, ss.str());
        }

        records.push_back(req);
    }
    return records;
}

std::vector<CustomerRequirement> readCustomerCsv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InputError("cannot open input file '" + path + "'");
    }
    return parseCustomerCsv(in);
}
