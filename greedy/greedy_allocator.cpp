///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "greedy_allocator.hpp"


///////////////////////////
///     ALLOCATORS      ///
///////////////////////////
/**
 * @brief Run the priority walk independently for each hour of the grid.
 *
 * The priority order is computed once; it only depends on the customers,
 * not on the hour.
 */
AllocationResult GreedyAllocator::allocate(DemandLedger& ledger, int capacity) {
    AllocationResult result;
    result.hours.reserve(ledger.hoursPerDay());

    const std::vector<int> order = ledger.customersByPriority();

    for (int hour = 0; hour < ledger.hoursPerDay(); ++hour) {
        result.hours.push_back(allocateHourByPriority(ledger, hour, capacity, order));
    }
    return result;
}
