///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "errors.hpp"
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Moves listed individually in the metrics summary before eliding the rest.
static constexpr int MAX_LISTED_MOVES = 10;

/**
 * @brief Join "name=agents" pairs with a separator; empty string if none.
 */
static std::string joinAgents(const std::vector<CustomerAgents>& items, const std::string& sep) {
    std::ostringstream ss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) ss << sep;
        ss << items[i].customer << "=" << items[i].agents;
    }
    return ss.str();
}

/**
 * @brief Integer with comma thousands separators (12345 -> "12,345").
 */
static std::string withThousands(long long value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    return value < 0 ? "-" + out : out;
}

static std::string percent(double ratio) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return ss.str();
}

static std::string callsLabel(double calls) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << calls;
    return ss.str();
}


///////////////////////////
///       FORMATS       ///
///////////////////////////
OutputFormat parseOutputFormat(const std::string& name) {
    if (name == "text") return OutputFormat::TEXT;
    if (name == "json") return OutputFormat::JSON;
    if (name == "csv") return OutputFormat::CSV;
    throw ConfigurationError("unknown output format '" + name + "' (expected text, json or csv)");
}

std::string formatExtension(OutputFormat format) {
    switch (format) {
        case OutputFormat::TEXT: return "txt";
        case OutputFormat::JSON: return "json";
        case OutputFormat::CSV:  return "csv";
    }
    return "txt";
}


///////////////////////////
///      RENDERING      ///
///////////////////////////
std::string hourLabel(int hour) {
    std::ostringstream ss;
    ss << std::setw(2) << std::setfill('0') << hour << ":00";
    return ss.str();
}

std::string formatText(const StaffingPlan& plan) {
    std::ostringstream ss;
    for (size_t i = 0; i < plan.schedule.hours.size(); ++i) {
        const ScheduleEntry& e = plan.schedule.hours[i];
        if (i > 0) ss << "\n";

        std::string customers = joinAgents(e.customers, ", ");
        ss << hourLabel(e.hour) << " : total=" << e.totalAgents << " ; "
           << (customers.empty() ? "none" : customers);

        if (plan.capacityConstrained() && !e.unmet.empty()) {
            ss << " | unmet: " << joinAgents(e.unmet, ", ");
        }
    }
    return ss.str();
}

/**
 * @brief Serialize the schedule with RapidJSON, two-space indentation.
 */
std::string formatJson(const StaffingPlan& plan) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartArray();
    for (const ScheduleEntry& e : plan.schedule.hours) {
        writer.StartObject();

        writer.Key("hour");
        writer.String(hourLabel(e.hour).c_str());

        writer.Key("total_agents");
        writer.Int(e.totalAgents);

        writer.Key("customers");
        writer.StartObject();
        for (const CustomerAgents& c : e.customers) {
            writer.Key(c.customer.c_str(), (rapidjson::SizeType)c.customer.size());
            writer.Int(c.agents);
        }
        writer.EndObject();

        if (!e.unmet.empty()) {
            writer.Key("unmet_demand");
            writer.StartObject();
            for (const CustomerAgents& u : e.unmet) {
                writer.Key(u.customer.c_str(), (rapidjson::SizeType)u.customer.size());
                writer.Int(u.agents);
            }
            writer.EndObject();
        }

        writer.EndObject();
    }
    writer.EndArray();

    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string formatCsv(const StaffingPlan& plan) {
    std::ostringstream ss;
    ss << "hour,total_agents,customers,unmet_demand";
    for (const ScheduleEntry& e : plan.schedule.hours) {
        std::string customers = joinAgents(e.customers, ";");
        ss << "\n" << hourLabel(e.hour) << "," << e.totalAgents
           << ",\"" << (customers.empty() ? "none" : customers) << "\""
           << ",\"" << joinAgents(e.unmet, ";") << "\"";
    }
    return ss.str();
}

std::string formatPlan(const StaffingPlan& plan, OutputFormat format) {
    switch (format) {
        case OutputFormat::TEXT: return formatText(plan);
        case OutputFormat::JSON: return formatJson(plan);
        case OutputFormat::CSV:  return formatCsv(plan);
    }
    return formatText(plan);
}


///////////////////////////
///       METRICS       ///
///////////////////////////
/**
 * @brief Print the run summary between two banner lines.
 *
 * Served volume comes from the allocation reports, so partially served
 * hours count their proportional share of calls.
 */
void printMetrics(std::ostream& out, const StaffingPlan& plan) {
    long long requested = 0;
    long long served = 0;
    for (const AllocationReport& r : plan.reports) {
        requested += r.requestedCalls;
        served += r.servedCalls;
    }
    double ratio = requested > 0 ? (double)served / requested : 1.0;

    const std::string banner(50, '=');
    out << "\n" << banner << "\n";
    out << "METRICS SUMMARY\n";
    out << banner << "\n";
    out << "Planning day:            " << plan.grid.hoursPerDay << " hours ("
        << plan.grid.zoneLabel << ")\n";
    out << "Total calls required:    " << withThousands(requested) << "\n";
    out << "Total calls served:      " << withThousands(served) << " (" << percent(ratio) << ")\n";
    out << "Total agent-hours:       " << withThousands(plan.schedule.totalAgentHours()) << "\n";
    out << "Peak agents (any hour):  " << withThousands(plan.schedule.peakAgents()) << "\n";

    if (!plan.reports.empty()) {
        out << "\nCustomer allocation:\n";
        for (const AllocationReport& r : plan.reports) {
            out << "  " << r.customer << " (priority " << r.priority << "): served "
                << withThousands(r.servedCalls) << "/" << withThousands(r.requestedCalls)
                << " calls (" << percent(r.utilization) << "), unmet "
                << withThousands(r.unmetCalls) << " calls, "
                << r.servedAgentHours << "/" << r.requiredAgentHours << " agent-hours\n";
        }
    }

    int unmet = plan.schedule.unmetAgentHours();
    if (unmet > 0) {
        out << "\nUnmet demand:            " << withThousands(unmet) << " agent-hours\n";
        out << std::string(50, '-') << "\n";
        out << "Unmet demand breakdown by hour:\n";
        for (const ScheduleEntry& e : plan.schedule.hours) {
            if (e.unmet.empty()) continue;
            int hourTotal = 0;
            for (const CustomerAgents& u : e.unmet) hourTotal += u.agents;
            out << "  " << hourLabel(e.hour) << " : " << withThousands(hourTotal)
                << " agents (" << joinAgents(e.unmet, ", ") << ")\n";
        }
    } else {
        out << "\nUnmet demand:            None\n";
    }

    if (plan.capacityConstrained() && plan.algorithm == Algorithm::SHIFT) {
        out << "\n[Shift Algorithm] " << plan.moves.size() << " call redistributions made";
        out << (plan.moves.empty() ? "\n" : ":\n");
        for (int i = 0; i < (int)plan.moves.size() && i < MAX_LISTED_MOVES; ++i) {
            const CallMove& m = plan.moves[i];
            out << "  " << plan.customerNames[m.customerIndex] << ": " << hourLabel(m.fromHour)
                << " -> " << hourLabel(m.toHour) << " (" << callsLabel(m.calls) << " calls)\n";
        }
        if ((int)plan.moves.size() > MAX_LISTED_MOVES) {
            out << "  ... and " << plan.moves.size() - MAX_LISTED_MOVES << " more\n";
        }
    }

    out << banner << "\n";
}


///////////////////////////
///     RESULT FILE     ///
///////////////////////////
std::string utilizationLabel(double utilization) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << utilization;
    std::string label = ss.str();
    while (!label.empty() && label.back() == '0') label.pop_back();
    if (!label.empty() && label.back() == '.') label.pop_back();
    return label;
}

std::string resultFileName(const std::string& timestamp,
                           const std::string& inputPath,
                           double utilization,
                           std::optional<int> capacity,
                           Algorithm algorithm,
                           OutputFormat format) {
    std::string stem = std::filesystem::path(inputPath).stem().string();

    std::ostringstream ss;
    ss << timestamp << "_" << stem << "_util" << utilizationLabel(utilization);
    if (capacity) {
        ss << "_cap" << *capacity;
        if (algorithm != Algorithm::GREEDY) ss << "_" << algorithmName(algorithm);
    }
    ss << "_RESULT." << formatExtension(format);
    return ss.str();
}

std::string currentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local = *std::localtime(&now);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return ss.str();
}

std::string writeResultFile(const std::string& content,
                            const std::string& directory,
                            const std::string& fileName) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("cannot create directory '" + directory + "': " + ec.message());
    }

    std::filesystem::path path = std::filesystem::path(directory) / fileName;
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open '" + path.string() + "' for writing");
    }
    out << content;
    if (!out) {
        throw std::runtime_error("failed writing '" + path.string() + "'");
    }
    return path.string();
}
