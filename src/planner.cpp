///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "planner.hpp"
#include "errors.hpp"
#include "../greedy/greedy_allocator.hpp"
#include "../shift/shift_allocator.hpp"
#include <sstream>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
Algorithm parseAlgorithm(const std::string& name) {
    if (name == "greedy") return Algorithm::GREEDY;
    if (name == "shift") return Algorithm::SHIFT;
    throw ConfigurationError("unknown algorithm '" + name + "' (expected greedy or shift)");
}

std::string algorithmName(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::GREEDY: return "greedy";
        case Algorithm::SHIFT:  return "shift";
    }
    return "unknown";
}

std::unique_ptr<IAllocator> makeAllocator(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::GREEDY: return std::make_unique<GreedyAllocator>();
        case Algorithm::SHIFT:  return std::make_unique<ShiftAllocator>();
    }
    throw ConfigurationError("unsupported allocation algorithm");
}


///////////////////////////
///      PLANNING       ///
///////////////////////////
void validateConfig(const PlannerConfig& config) {
    if (!(config.utilization > 0.0)) {
        std::ostringstream ss;
        ss << "utilization must be positive, got " << config.utilization;
        throw ConfigurationError(ss.str());
    }
    if (config.capacity && *config.capacity < 0) {
        std::ostringstream ss;
        ss << "capacity must be non-negative, got " << *config.capacity;
        throw ConfigurationError(ss.str());
    }
}

/**
 * @brief Validate configuration, expand demand, then hand over to the
 *        ledger overload.
 */
StaffingPlan planStaffing(const std::vector<CustomerRequirement>& customers, const PlannerConfig& config) {
    validateConfig(config);
    DemandLedger ledger(customers, config.utilization, config.grid);
    return planStaffing(ledger, config);
}

/**
 * @brief Allocate, verify the ledger invariants, then aggregate.
 *
 * The invariant check runs before any output is built, so a broken
 * redistribution can never produce a plan.
 */
StaffingPlan planStaffing(DemandLedger& ledger, const PlannerConfig& config) {
    validateConfig(config);

    AllocationResult allocation;
    if (config.capacity) {
        std::unique_ptr<IAllocator> allocator = makeAllocator(config.algorithm);
        allocation = allocator->allocate(ledger, *config.capacity);
    } else {
        allocation = allocateUncapped(ledger);
    }

    ledger.checkInvariants();

    StaffingPlan plan;
    plan.schedule = buildSchedule(ledger, allocation);
    plan.reports = buildReports(ledger, allocation);
    plan.moves = allocation.moves;
    for (const CustomerRequirement& c : ledger.customers()) plan.customerNames.push_back(c.name);
    plan.utilization = ledger.utilization();
    plan.capacity = config.capacity;
    plan.algorithm = config.algorithm;
    plan.grid = ledger.grid();
    return plan;
}
