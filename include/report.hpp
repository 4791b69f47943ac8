#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "demand.hpp"
#include "allocation.hpp"
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Agent count attributed to one named customer.
 */
struct CustomerAgents {
    std::string customer; ///< Customer name.
    int agents; ///< Agent count (served or unmet, depending on the list).
};

/**
 * @brief Final staffing of one hour bucket.
 */
struct ScheduleEntry {
    int hour; ///< Hour bucket index.
    int totalAgents; ///< Agents scheduled in the hour.
    std::vector<CustomerAgents> customers; ///< Served agents per customer (non-zero only).
    std::vector<CustomerAgents> unmet; ///< Unserved agents per customer (non-zero only).
};

/**
 * @brief Agents required in every hour of the day.
 *
 * Always holds one entry per hour of the grid, zero-filled where nothing
 * is scheduled.
 */
struct Schedule {
    std::vector<ScheduleEntry> hours;

    int totalAgentHours() const;
    int peakAgents() const;
    int unmetAgentHours() const;
};

/**
 * @brief Daily service summary for one customer.
 */
struct AllocationReport {
    std::string customer; ///< Customer name.
    int priority; ///< Customer priority (1 = highest).
    int requestedCalls; ///< Call volume asked for.
    int servedCalls; ///< Calls covered by scheduled agents, rounded half-up.
    int unmetCalls; ///< requestedCalls - servedCalls.
    double utilization; ///< servedCalls / requestedCalls (1.0 when nothing was requested).
    int requiredAgentHours; ///< Uncapped agent-hours over the day.
    int servedAgentHours; ///< Agent-hours actually scheduled.

    int unmetAgentHours() const { return requiredAgentHours - servedAgentHours; }
};


///////////////////////////
///     AGGREGATION     ///
///////////////////////////
/**
 * @brief Sum the hour allocations into the day's schedule.
 *
 * Hours missing from @p allocation still get an entry with zero agents.
 */
Schedule buildSchedule(const DemandLedger& ledger, const AllocationResult& allocation);

/**
 * @brief Per-customer served versus requested volume, in input order.
 */
std::vector<AllocationReport> buildReports(const DemandLedger& ledger, const AllocationResult& allocation);

/**
 * @brief Round a call count half-up to a whole call.
 */
int roundCalls(double calls);
