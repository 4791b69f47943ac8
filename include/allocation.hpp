#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "demand.hpp"
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Outcome for one customer in one hour.
 */
struct CustomerHourAllocation {
    int customerIndex; ///< Customer in the ledger.
    int requiredAgents; ///< Uncapped agents for the hour's current calls.
    int servedAgents; ///< Agents actually granted (<= requiredAgents).
    double requestedCalls; ///< Current calls in the hour.
    double servedCalls; ///< Calls covered by the granted agents.

    int unmetAgents() const { return requiredAgents - servedAgents; }
};

/**
 * @brief All customer allocations of a single hour bucket.
 *
 * Entries appear in the order the allocator walked them: priority order
 * when capacity is enforced, input order otherwise.
 */
struct HourAllocation {
    int hour; ///< Hour bucket index.
    std::vector<CustomerHourAllocation> customers; ///< Customers with demand this hour.

    /// Sum of served agents over all customers in the hour.
    int totalAgents() const;

    /// Sum of unserved agents over all customers in the hour.
    int unmetAgents() const;
};

/**
 * @brief One redistribution of calls between hours of a customer.
 */
struct CallMove {
    int customerIndex; ///< Customer whose calls moved.
    int fromHour; ///< Overflow hour the calls left.
    int toHour; ///< Hour with spare capacity that received them.
    double calls; ///< Number of calls moved (may be fractional).
};

/**
 * @brief Result of one allocation pass over the full day.
 */
struct AllocationResult {
    /// One entry per hour of the day grid, hour ascending.
    std::vector<HourAllocation> hours;

    /// Redistribution moves, in the order they were applied (empty for greedy).
    std::vector<CallMove> moves;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for capacity allocation policies.
 *
 * An allocator receives the run's demand ledger and a per-hour agent
 * ceiling, and returns an allocation in which no hour exceeds the ceiling.
 * Policies that redistribute demand do so through the ledger, so the
 * caller sees the final currentCalls afterwards.
 */
class IAllocator {
public:
    virtual ~IAllocator() = default;

    /**
     * @brief Allocate at most @p capacity agents to every hour.
     *
     * Demand that does not fit is reported as unmet, never raised as an error.
     */
    virtual AllocationResult allocate(DemandLedger& ledger, int capacity) = 0;

    /// Short policy name ("greedy", "shift").
    virtual std::string name() const = 0;
};


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Allocation with no ceiling: every customer gets its baseline.
 */
AllocationResult allocateUncapped(const DemandLedger& ledger);

/**
 * @brief Priority walk over one hour with a capacity ceiling.
 *
 * Customers are visited in @p priorityOrder. Each is fully served while its
 * requirement fits in the remaining capacity; the first one that does not
 * fit gets what is left, with its served calls scaled by
 * servedAgents / requiredAgents, and every later customer gets nothing.
 * Customers without calls in the hour are skipped.
 */
HourAllocation allocateHourByPriority(const DemandLedger& ledger,
                                      int hour,
                                      int capacity,
                                      const std::vector<int>& priorityOrder);
