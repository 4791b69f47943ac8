///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demand.hpp"
#include "baseline.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Allowed drift between a customer's summed calls and its volume.
 *
 * Redistribution moves fractional call rates, so sums are compared with a
 * tolerance relative to the volume.
 */
static double volumeTolerance(double volume) {
    return 1e-6 * std::max(1.0, std::fabs(volume));
}


///////////////////////////
///       LEDGER        ///
///////////////////////////
/**
 * @brief Validate, then give each active hour an equal share of the volume.
 */
DemandLedger::DemandLedger(const std::vector<CustomerRequirement>& customers,
                           double utilization,
                           const DayGrid& grid)
        : customers_(customers), grid_(grid), utilization_(utilization) {
    validate();

    byHour_.assign(grid_.hoursPerDay, std::vector<int>());
    byCustomer_.assign(customers_.size(), std::vector<int>());

    int totalHours = 0;
    for (const CustomerRequirement& c : customers_) totalHours += c.activeHours();
    records_.reserve(totalHours);

    for (int c = 0; c < (int)customers_.size(); ++c) {
        const CustomerRequirement& req = customers_[c];
        double callsPerHour = (double)req.totalCalls / req.activeHours();
        for (int hour = req.startHour; hour < req.endHour; ++hour) {
            addRecord(c, hour, callsPerHour);
        }
    }
}

/**
 * @brief Validate requirements and profiles, then copy each profile in.
 */
DemandLedger::DemandLedger(const std::vector<CustomerRequirement>& customers,
                           const std::vector<std::vector<double>>& hourlyCalls,
                           double utilization,
                           const DayGrid& grid)
        : customers_(customers), grid_(grid), utilization_(utilization) {
    validate();

    if (hourlyCalls.size() != customers_.size()) {
        std::ostringstream ss;
        ss << "expected " << customers_.size() << " call profiles, got " << hourlyCalls.size();
        throw ContractViolation(ss.str());
    }

    byHour_.assign(grid_.hoursPerDay, std::vector<int>());
    byCustomer_.assign(customers_.size(), std::vector<int>());

    for (int c = 0; c < (int)customers_.size(); ++c) {
        const CustomerRequirement& req = customers_[c];
        const std::vector<double>& profile = hourlyCalls[c];

        if ((int)profile.size() != req.activeHours()) {
            std::ostringstream ss;
            ss << "customer '" << req.name << "': profile has " << profile.size()
               << " hours, window has " << req.activeHours();
            throw ContractViolation(ss.str());
        }

        double sum = 0.0;
        for (double calls : profile) {
            if (calls < 0.0) {
                throw ContractViolation("customer '" + req.name + "': negative calls in profile");
            }
            sum += calls;
        }
        if (std::fabs(sum - req.totalCalls) > volumeTolerance(req.totalCalls)) {
            std::ostringstream ss;
            ss << "customer '" << req.name << "': profile sums to " << sum
               << ", expected " << req.totalCalls;
            throw ContractViolation(ss.str());
        }

        for (int i = 0; i < (int)profile.size(); ++i) {
            addRecord(c, req.startHour + i, profile[i]);
        }
    }
}

/**
 * @brief Reject bad configuration first, then any record the input layer
 *        should never have let through.
 */
void DemandLedger::validate() const {
    if (!(utilization_ > 0.0)) {
        std::ostringstream ss;
        ss << "utilization must be positive, got " << utilization_;
        throw ConfigurationError(ss.str());
    }
    if (grid_.hoursPerDay <= 0) {
        throw ConfigurationError("day grid must have at least one hour");
    }

    std::set<std::string> names;
    double totalLoad = 0.0;
    for (const CustomerRequirement& req : customers_) {
        std::ostringstream ss;
        ss << "customer '" << req.name << "': ";

        if (req.name.empty()) {
            throw ContractViolation("customer name must not be empty");
        }
        if (!names.insert(req.name).second) {
            ss << "duplicate customer name";
            throw ContractViolation(ss.str());
        }
        if (req.startHour < 0 || req.endHour > grid_.hoursPerDay || req.endHour <= req.startHour) {
            ss << "invalid window [" << req.startHour << ", " << req.endHour << ")";
            throw ContractViolation(ss.str());
        }
        if (req.priority < HIGHEST_PRIORITY || req.priority > LOWEST_PRIORITY) {
            ss << "priority " << req.priority << " outside "
               << HIGHEST_PRIORITY << "-" << LOWEST_PRIORITY;
            throw ContractViolation(ss.str());
        }
        if (req.totalCalls < 0) {
            ss << "negative call volume " << req.totalCalls;
            throw ContractViolation(ss.str());
        }
        if (!(req.avgDurationSeconds > 0.0)) {
            ss << "non-positive call duration " << req.avgDurationSeconds;
            throw ContractViolation(ss.str());
        }

        // Bound the load as if the whole volume landed in one hour, which is
        // as far as redistribution can concentrate it.
        double load = agentLoad(req.totalCalls, req.avgDurationSeconds, utilization_);
        if (!(load <= MAX_AGENT_LOAD)) {
            ss << "daily load of " << load << " agents exceeds the supported maximum of " << MAX_AGENT_LOAD;
            throw ContractViolation(ss.str());
        }
        totalLoad += load;
    }

    if (totalLoad > MAX_AGENT_LOAD) {
        std::ostringstream ss;
        ss << "combined daily load of " << totalLoad << " agents exceeds the supported maximum of "
           << MAX_AGENT_LOAD;
        throw ContractViolation(ss.str());
    }
}

void DemandLedger::addRecord(int customerIndex, int hour, double calls) {
    int id = (int)records_.size();
    records_.push_back({customerIndex, hour, calls, calls});
    byHour_[hour].push_back(id);
    byCustomer_[customerIndex].push_back(id);
}

/**
 * @brief Records of a customer are contiguous and hour-ordered, so the id is
 *        an offset from the first one.
 */
int DemandLedger::recordAt(int customerIndex, int hour) const {
    const CustomerRequirement& req = customers_[customerIndex];
    if (!req.coversHour(hour)) return -1;
    return byCustomer_[customerIndex][hour - req.startHour];
}

std::vector<int> DemandLedger::customersByPriority() const {
    std::vector<int> order(customers_.size());
    for (int i = 0; i < (int)order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [this](int a, int b) {
        return customers_[a].priority < customers_[b].priority;
    });
    return order;
}

std::vector<int> DemandLedger::customersByPriorityDescending() const {
    std::vector<int> order(customers_.size());
    for (int i = 0; i < (int)order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [this](int a, int b) {
        return customers_[a].priority > customers_[b].priority;
    });
    return order;
}

int DemandLedger::requiredAgents(int recordId) const {
    const HourlyDemand& rec = records_[recordId];
    return requiredAgentsFor(rec.customerIndex, rec.currentCalls);
}

int DemandLedger::requiredAgentsFor(int customerIndex, double calls) const {
    return ::requiredAgents(calls, customers_[customerIndex].avgDurationSeconds, utilization_);
}

double DemandLedger::callsPerAgent(int customerIndex) const {
    return SECONDS_PER_HOUR * utilization_ / customers_[customerIndex].avgDurationSeconds;
}

int DemandLedger::hourLoad(int hour) const {
    int total = 0;
    for (int id : byHour_[hour]) total += requiredAgents(id);
    return total;
}

double DemandLedger::customerCalls(int customerIndex) const {
    double sum = 0.0;
    for (int id : byCustomer_[customerIndex]) sum += records_[id].currentCalls;
    return sum;
}

/**
 * @brief Transfer calls between two records of one customer.
 *
 * A request slightly above the source's calls (float residue) is clamped;
 * anything beyond the tolerance is a caller bug.
 */
void DemandLedger::moveCalls(int fromRecord, int toRecord, double calls) {
    if (fromRecord < 0 || fromRecord >= recordCount() || toRecord < 0 || toRecord >= recordCount()) {
        throw ContractViolation("call move references an unknown demand record");
    }
    HourlyDemand& from = records_[fromRecord];
    HourlyDemand& to = records_[toRecord];

    if (from.customerIndex != to.customerIndex) {
        throw ContractViolation("calls can only move between hours of the same customer");
    }
    if (calls < 0.0) {
        throw ContractViolation("cannot move a negative number of calls");
    }
    if (calls > from.currentCalls + volumeTolerance(from.currentCalls)) {
        std::ostringstream ss;
        ss << "customer '" << customers_[from.customerIndex].name << "': cannot move "
           << calls << " calls out of hour " << from.hour << " holding " << from.currentCalls;
        throw ContractViolation(ss.str());
    }

    calls = std::min(calls, from.currentCalls);
    from.currentCalls -= calls;
    to.currentCalls += calls;
}

void DemandLedger::checkInvariants() const {
    for (int c = 0; c < (int)customers_.size(); ++c) {
        const CustomerRequirement& req = customers_[c];

        for (int id : byCustomer_[c]) {
            const HourlyDemand& rec = records_[id];
            if (!req.coversHour(rec.hour) && rec.currentCalls > 0.0) {
                std::ostringstream ss;
                ss << "customer '" << req.name << "' has calls in hour " << rec.hour
                   << " outside its window";
                throw ContractViolation(ss.str());
            }
        }

        double sum = customerCalls(c);
        if (std::fabs(sum - req.totalCalls) > volumeTolerance(req.totalCalls)) {
            std::ostringstream ss;
            ss << "customer '" << req.name << "' holds " << sum
               << " calls, expected " << req.totalCalls;
            throw ContractViolation(ss.str());
        }
    }
}
