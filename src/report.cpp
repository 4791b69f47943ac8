///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "report.hpp"
#include <algorithm>
#include <cmath>


///////////////////////////
///        TYPES        ///
///////////////////////////
int Schedule::totalAgentHours() const {
    int total = 0;
    for (const ScheduleEntry& e : hours) total += e.totalAgents;
    return total;
}

int Schedule::peakAgents() const {
    int peak = 0;
    for (const ScheduleEntry& e : hours) peak = std::max(peak, e.totalAgents);
    return peak;
}

int Schedule::unmetAgentHours() const {
    int total = 0;
    for (const ScheduleEntry& e : hours) {
        for (const CustomerAgents& u : e.unmet) total += u.agents;
    }
    return total;
}


///////////////////////////
///     AGGREGATION     ///
///////////////////////////
int roundCalls(double calls) {
    // Absorb float residue before rounding so 2.4999999999 still rounds like 2.5.
    return (int)std::floor(calls + 0.5 + 1e-9);
}

/**
 * @brief One entry per grid hour; customers keep the allocator's order.
 */
Schedule buildSchedule(const DemandLedger& ledger, const AllocationResult& allocation) {
    Schedule schedule;
    schedule.hours.resize(ledger.hoursPerDay());
    for (int hour = 0; hour < ledger.hoursPerDay(); ++hour) {
        schedule.hours[hour].hour = hour;
        schedule.hours[hour].totalAgents = 0;
    }

    for (const HourAllocation& alloc : allocation.hours) {
        if (alloc.hour < 0 || alloc.hour >= ledger.hoursPerDay()) continue;
        ScheduleEntry& entry = schedule.hours[alloc.hour];

        for (const CustomerHourAllocation& c : alloc.customers) {
            const std::string& name = ledger.customer(c.customerIndex).name;
            if (c.servedAgents > 0) {
                entry.customers.push_back({name, c.servedAgents});
                entry.totalAgents += c.servedAgents;
            }
            if (c.unmetAgents() > 0) {
                entry.unmet.push_back({name, c.unmetAgents()});
            }
        }
    }
    return schedule;
}

/**
 * @brief Accumulate each customer's hourly outcomes into a daily report.
 *
 * Served calls are summed unrounded across hours and rounded once, so a
 * partially served customer loses at most half a call to rounding.
 */
std::vector<AllocationReport> buildReports(const DemandLedger& ledger, const AllocationResult& allocation) {
    int n = ledger.customerCount();
    std::vector<double> servedCalls(n, 0.0);
    std::vector<int> requiredAgentHours(n, 0);
    std::vector<int> servedAgentHours(n, 0);

    for (const HourAllocation& alloc : allocation.hours) {
        for (const CustomerHourAllocation& c : alloc.customers) {
            servedCalls[c.customerIndex] += c.servedCalls;
            requiredAgentHours[c.customerIndex] += c.requiredAgents;
            servedAgentHours[c.customerIndex] += c.servedAgents;
        }
    }

    std::vector<AllocationReport> reports;
    reports.reserve(n);
    for (int c = 0; c < n; ++c) {
        const CustomerRequirement& req = ledger.customer(c);

        AllocationReport r;
        r.customer = req.name;
        r.priority = req.priority;
        r.requestedCalls = req.totalCalls;
        r.servedCalls = std::min(req.totalCalls, roundCalls(servedCalls[c]));
        r.unmetCalls = r.requestedCalls - r.servedCalls;
        r.utilization = req.totalCalls > 0 ? (double)r.servedCalls / req.totalCalls : 1.0;
        r.requiredAgentHours = requiredAgentHours[c];
        r.servedAgentHours = servedAgentHours[c];
        reports.push_back(r);
    }
    return reports;
}
