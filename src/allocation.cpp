///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "allocation.hpp"
#include <algorithm>


///////////////////////////
///        TYPES        ///
///////////////////////////
int HourAllocation::totalAgents() const {
    int total = 0;
    for (const CustomerHourAllocation& c : customers) total += c.servedAgents;
    return total;
}

int HourAllocation::unmetAgents() const {
    int total = 0;
    for (const CustomerHourAllocation& c : customers) total += c.unmetAgents();
    return total;
}


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Baseline allocation: each record is served in full.
 *
 * Hours are walked in grid order and customers in input order, which is
 * the order recordsInHour() already keeps.
 */
AllocationResult allocateUncapped(const DemandLedger& ledger) {
    AllocationResult result;
    result.hours.reserve(ledger.hoursPerDay());

    for (int hour = 0; hour < ledger.hoursPerDay(); ++hour) {
        HourAllocation alloc;
        alloc.hour = hour;

        for (int id : ledger.recordsInHour(hour)) {
            const HourlyDemand& rec = ledger.record(id);
            if (rec.currentCalls <= 0.0) continue;

            int agents = ledger.requiredAgents(id);
            alloc.customers.push_back({rec.customerIndex, agents, agents,
                                       rec.currentCalls, rec.currentCalls});
        }
        result.hours.push_back(alloc);
    }
    return result;
}

/**
 * @brief Serve customers of one hour in priority order until capacity runs out.
 */
HourAllocation allocateHourByPriority(const DemandLedger& ledger,
                                      int hour,
                                      int capacity,
                                      const std::vector<int>& priorityOrder) {
    HourAllocation alloc;
    alloc.hour = hour;

    int remaining = std::max(0, capacity);

    for (int c : priorityOrder) {
        int id = ledger.recordAt(c, hour);
        if (id < 0) continue;

        const HourlyDemand& rec = ledger.record(id);
        if (rec.currentCalls <= 0.0) continue;

        int required = ledger.requiredAgents(id);
        int served = std::min(required, remaining);
        remaining -= served;

        // Partial service covers a proportional share of the hour's calls.
        double servedCalls = rec.currentCalls;
        if (served < required) {
            servedCalls = required > 0 ? rec.currentCalls * served / required : 0.0;
        }

        alloc.customers.push_back({c, required, served, rec.currentCalls, servedCalls});
    }
    return alloc;
}
