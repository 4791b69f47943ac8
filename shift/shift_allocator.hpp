#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "demand.hpp"
#include "allocation.hpp"
#include <vector>


///////////////////////////
///     ALLOCATORS      ///
///////////////////////////
/**
 * @brief Overflow redistribution followed by a priority allocation.
 *
 * First pass: for every hour whose uncapped load exceeds the ceiling, calls
 * are moved out of it into hours of the same customer's window that still
 * have spare agents, nearest hour first. Customers are tried lowest
 * priority first. Customers holding the best priority present in the hour
 * are not moved at all while a lower-priority customer shares that hour;
 * only when everyone in the hour has the same priority may any of them
 * move. Moves only consume spare capacity, so no hour ever loses agents to
 * make room for a moved call.
 *
 * Second pass: every hour is allocated in priority order as the greedy
 * policy does, on the redistributed calls. Whatever could not move shows
 * up as unmet demand there.
 */
class ShiftAllocator : public IAllocator {
public:
    AllocationResult allocate(DemandLedger& ledger, int capacity) override;

    std::string name() const override { return "shift"; }

private:
    /// Ledger being redistributed (owned by the caller, valid only during allocate()).
    DemandLedger* ledger_ = nullptr;

    /// Per-hour agent ceiling for the current run.
    int capacity_ = 0;

    /// load_[hour] = uncapped agents currently required in that hour.
    std::vector<int> load_;

    /// Moves applied so far, in order.
    std::vector<CallMove> moves_;

    /// Returned by protectedPriorityIn() when no customer is protected.
    static constexpr int NO_PROTECTED_PRIORITY = -1;

    /**
     * @brief Priority whose customers must stay put in an overflow hour.
     */
    int protectedPriorityIn(int hour) const;

    /**
     * @brief Move one customer's calls out of an overflow hour.
     *
     * Fills spillover candidates in order until the hour no longer
     * overflows, the customer has no calls left in it, or candidates run out.
     */
    void shiftOverflow(int customerIndex, int sourceHour);

    /**
     * @brief Hours of the customer's window, other than @p sourceHour, with
     *        spare capacity.
     *
     * Ordered by distance to @p sourceHour, ties broken by the earlier hour.
     */
    std::vector<int> spilloverCandidates(int customerIndex, int sourceHour) const;
};
