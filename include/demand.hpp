#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///       LEDGER        ///
///////////////////////////
/**
 * @brief Arena holding every HourlyDemand record of one planning run.
 *
 * Records are created once, at construction, and keep a stable integer id
 * for the lifetime of the ledger. Orderings (by hour, by priority) are index
 * lists into the same arena, so a change made through one ordering is seen
 * through every other one.
 *
 * Invariants kept by the ledger:
 *  - exactly one record per (customer, active hour),
 *  - sum of currentCalls per customer equals its totalCalls,
 *  - no record exists outside its customer's [startHour, endHour) window,
 *  - originalCalls never changes after construction.
 */
class DemandLedger {
public:
    /**
     * @brief Expand requirements uniformly over their active hours.
     *
     * Each active hour receives totalCalls / (endHour - startHour) calls.
     *
     * @throws ConfigurationError if utilization <= 0 or the grid is empty.
     * @throws ContractViolation  if a requirement breaks the input contract,
     *         or the combined load exceeds MAX_AGENT_LOAD.
     */
    DemandLedger(const std::vector<CustomerRequirement>& customers,
                 double utilization,
                 const DayGrid& grid = DayGrid());

    /**
     * @brief Build a ledger from explicit per-hour call profiles.
     *
     * hourlyCalls[c][i] is the call count of customer c in hour
     * customers[c].startHour + i. Each profile must span the customer's whole
     * window and add up to its totalCalls.
     *
     * @throws ConfigurationError if utilization <= 0 or the grid is empty.
     * @throws ContractViolation  on a bad requirement or profile.
     */
    DemandLedger(const std::vector<CustomerRequirement>& customers,
                 const std::vector<std::vector<double>>& hourlyCalls,
                 double utilization,
                 const DayGrid& grid = DayGrid());

    int customerCount() const { return (int)customers_.size(); }
    const CustomerRequirement& customer(int customerIndex) const { return customers_[customerIndex]; }
    const std::vector<CustomerRequirement>& customers() const { return customers_; }

    int recordCount() const { return (int)records_.size(); }
    const HourlyDemand& record(int recordId) const { return records_[recordId]; }

    const DayGrid& grid() const { return grid_; }
    int hoursPerDay() const { return grid_.hoursPerDay; }
    double utilization() const { return utilization_; }

    /**
     * @brief Id of the record for (customer, hour), or -1 if the hour is
     *        outside the customer's window.
     */
    int recordAt(int customerIndex, int hour) const;

    /// Record ids active in @p hour, in customer input order.
    const std::vector<int>& recordsInHour(int hour) const { return byHour_[hour]; }

    /// Record ids of one customer, in hour order.
    const std::vector<int>& recordsOfCustomer(int customerIndex) const { return byCustomer_[customerIndex]; }

    /// Customer indices, priority 1 first, ties in input order.
    std::vector<int> customersByPriority() const;

    /// Customer indices, priority 5 first, ties in input order.
    std::vector<int> customersByPriorityDescending() const;

    /// Uncapped agents needed for a record's current calls.
    int requiredAgents(int recordId) const;

    /// Uncapped agents needed for @p calls of the given customer.
    int requiredAgentsFor(int customerIndex, double calls) const;

    /// Calls one agent handles in an hour for this customer.
    double callsPerAgent(int customerIndex) const;

    /// Sum of requiredAgents() over every record in @p hour.
    int hourLoad(int hour) const;

    /// Sum of currentCalls over a customer's records.
    double customerCalls(int customerIndex) const;

    /**
     * @brief Move calls between two hours of the same customer.
     *
     * Only currentCalls is touched. Moving from or to a record of another
     * customer, or more calls than the source holds, is rejected.
     *
     * @throws ContractViolation on an illegal move.
     */
    void moveCalls(int fromRecord, int toRecord, double calls);

    /**
     * @brief Re-check volume conservation and window containment.
     *
     * @throws ContractViolation if either invariant is broken.
     */
    void checkInvariants() const;

private:
    /// Customers in input order; indices are stable for the run.
    std::vector<CustomerRequirement> customers_;

    /// The arena. Never resized after construction.
    std::vector<HourlyDemand> records_;

    /// byHour_[hour] = record ids active in that hour.
    std::vector<std::vector<int>> byHour_;

    /// byCustomer_[customer] = record ids of that customer, hour ascending.
    std::vector<std::vector<int>> byCustomer_;

    DayGrid grid_;
    double utilization_;

    /// Validate configuration and every requirement before building records.
    void validate() const;

    /// Append one record and index it.
    void addRecord(int customerIndex, int hour, double calls);
};
