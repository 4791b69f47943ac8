///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "shift_allocator.hpp"
#include <algorithm>
#include <cstdlib>


///////////////////////////
///     ALLOCATORS      ///
///////////////////////////
/**
 * @brief Redistribute overflow, then allocate every hour by priority.
 */
AllocationResult ShiftAllocator::allocate(DemandLedger& ledger, int capacity) {
    ledger_ = &ledger;
    capacity_ = capacity;
    moves_.clear();

    // Uncapped load per hour; kept in step with every move below.
    load_.assign(ledger.hoursPerDay(), 0);
    for (int hour = 0; hour < ledger.hoursPerDay(); ++hour) {
        load_[hour] = ledger.hourLoad(hour);
    }

    // Lowest priority first: those customers are the first to be moved.
    const std::vector<int> shiftOrder = ledger.customersByPriorityDescending();

    for (int hour = 0; hour < ledger.hoursPerDay(); ++hour) {
        if (load_[hour] <= capacity_) continue;

        int protectedPriority = protectedPriorityIn(hour);

        for (int c : shiftOrder) {
            if (load_[hour] <= capacity_) break;
            if (ledger.customer(c).priority == protectedPriority) continue;

            int id = ledger.recordAt(c, hour);
            if (id < 0 || ledger.record(id).currentCalls <= 0.0) continue;

            shiftOverflow(c, hour);
        }
    }

    // Final allocation on the redistributed demand, highest priority first.
    AllocationResult result;
    result.hours.reserve(ledger.hoursPerDay());

    const std::vector<int> priorityOrder = ledger.customersByPriority();
    for (int hour = 0; hour < ledger.hoursPerDay(); ++hour) {
        result.hours.push_back(allocateHourByPriority(ledger, hour, capacity_, priorityOrder));
    }
    result.moves = moves_;

    ledger_ = nullptr;
    return result;
}

/**
 * @brief Push a customer's calls from an overflow hour into nearby spare hours.
 *
 * Each move is sized in whole agents: at most the hour's remaining overflow
 * and at most the target's spare agents, converted back to calls. Loads of
 * both hours are re-derived from the ledger after the move, so fractional
 * remainders are accounted for exactly.
 */
void ShiftAllocator::shiftOverflow(int customerIndex, int sourceHour) {
    DemandLedger& ledger = *ledger_;
    const int source = ledger.recordAt(customerIndex, sourceHour);
    const double callsPerAgent = ledger.callsPerAgent(customerIndex);

    for (int targetHour : spilloverCandidates(customerIndex, sourceHour)) {
        int overflow = load_[sourceHour] - capacity_;
        if (overflow <= 0) break;

        double available = ledger.record(source).currentCalls;
        if (available <= 0.0) break;

        int spare = capacity_ - load_[targetHour];
        if (spare <= 0) continue;

        int agents = std::min(overflow, spare);
        double calls = std::min(available, agents * callsPerAgent);
        if (calls <= 0.0) continue;

        const int target = ledger.recordAt(customerIndex, targetHour);
        int sourceBefore = ledger.requiredAgents(source);
        int targetBefore = ledger.requiredAgents(target);

        ledger.moveCalls(source, target, calls);

        load_[sourceHour] += ledger.requiredAgents(source) - sourceBefore;
        load_[targetHour] += ledger.requiredAgents(target) - targetBefore;

        moves_.push_back({customerIndex, sourceHour, targetHour, calls});
    }
}

/**
 * @brief Best priority present in the hour, if a worse one is present too.
 *
 * When every customer in the hour shares one priority, none is protected
 * and NO_PROTECTED_PRIORITY is returned.
 */
int ShiftAllocator::protectedPriorityIn(int hour) const {
    int best = LOWEST_PRIORITY + 1;
    int worst = HIGHEST_PRIORITY - 1;
    for (int id : ledger_->recordsInHour(hour)) {
        const HourlyDemand& rec = ledger_->record(id);
        if (rec.currentCalls <= 0.0) continue;
        int priority = ledger_->customer(rec.customerIndex).priority;
        best = std::min(best, priority);
        worst = std::max(worst, priority);
    }
    return worst > best ? best : NO_PROTECTED_PRIORITY;
}

std::vector<int> ShiftAllocator::spilloverCandidates(int customerIndex, int sourceHour) const {
    const CustomerRequirement& req = ledger_->customer(customerIndex);

    std::vector<int> candidates;
    for (int hour = req.startHour; hour < req.endHour; ++hour) {
        if (hour == sourceHour) continue;
        if (capacity_ - load_[hour] > 0) candidates.push_back(hour);
    }

    std::sort(candidates.begin(), candidates.end(), [sourceHour](int a, int b) {
        int da = std::abs(a - sourceHour);
        int db = std::abs(b - sourceHour);
        if (da != db) return da < db;
        return a < b;
    });
    return candidates;
}
