#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "demand.hpp"
#include "allocation.hpp"
#include "report.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
/**
 * @brief Capacity allocation policy.
 */
enum class Algorithm { GREEDY, SHIFT };

/**
 * @brief Everything a planning run depends on besides the customers.
 */
struct PlannerConfig {
    double utilization = 1.0; ///< Productive fraction of an agent's hour; must be > 0.
    std::optional<int> capacity; ///< Agents available per hour; absent = uncapped.
    Algorithm algorithm = Algorithm::GREEDY; ///< Policy used when capacity is set.
    DayGrid grid; ///< Hours of the planning day.
};

/**
 * @brief Parse "greedy" or "shift".
 *
 * @throws ConfigurationError for any other name.
 */
Algorithm parseAlgorithm(const std::string& name);

/// Lower-case name of an algorithm, as accepted by parseAlgorithm().
std::string algorithmName(Algorithm algorithm);

/**
 * @brief Create the allocator implementing @p algorithm.
 */
std::unique_ptr<IAllocator> makeAllocator(Algorithm algorithm);


///////////////////////////
///       RESULT        ///
///////////////////////////
/**
 * @brief Complete output of one planning run.
 */
struct StaffingPlan {
    Schedule schedule; ///< Agents per hour for the whole day.
    std::vector<AllocationReport> reports; ///< One report per customer, input order.
    std::vector<CallMove> moves; ///< Redistribution moves (shift policy only).
    std::vector<std::string> customerNames; ///< Names by customer index, for resolving moves.
    double utilization = 1.0; ///< Utilization the plan was computed with.
    std::optional<int> capacity; ///< Ceiling the plan was computed with, if any.
    Algorithm algorithm = Algorithm::GREEDY; ///< Policy used when capacity is set.
    DayGrid grid; ///< Day the schedule covers.

    bool capacityConstrained() const { return capacity.has_value(); }
};


///////////////////////////
///      PLANNING       ///
///////////////////////////
/**
 * @brief Check a configuration without running anything.
 *
 * @throws ConfigurationError if utilization <= 0 or capacity < 0.
 */
void validateConfig(const PlannerConfig& config);

/**
 * @brief Plan staffing for a set of customer requirements.
 *
 * Expands demand uniformly, allocates it (uncapped, greedy or shift) and
 * aggregates the result. Every error is raised before a plan exists.
 *
 * @throws ConfigurationError on invalid configuration.
 * @throws ContractViolation  on a requirement that breaks the input contract.
 */
StaffingPlan planStaffing(const std::vector<CustomerRequirement>& customers, const PlannerConfig& config);

/**
 * @brief Plan staffing over an already built demand ledger.
 *
 * The ledger's utilization and grid are used; those of @p config are
 * ignored. The ledger is modified in place when the shift policy runs.
 */
StaffingPlan planStaffing(DemandLedger& ledger, const PlannerConfig& config);
