#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///      BASELINE       ///
///////////////////////////
/// Slack subtracted before rounding up, so float residue never adds an agent.
static constexpr double AGENT_ROUNDING_TOLERANCE = 1e-9;

/// Largest agent load a run may carry in total; keeps every per-hour and
/// per-day agent sum well inside int.
static constexpr double MAX_AGENT_LOAD = 1.0e9;

/**
 * @brief Fractional agent load produced by a call rate.
 *
 * load = callsPerHour * avgDurationSeconds / 3600 / utilization
 *
 * @throws ConfigurationError if utilization <= 0.
 */
double agentLoad(double callsPerHour, double avgDurationSeconds, double utilization);

/**
 * @brief Uncapped number of agents needed to handle a call rate.
 *
 * Rounds agentLoad() up to the next whole agent. Zero or negative call
 * rates need no agents.
 *
 * @throws ConfigurationError if utilization <= 0.
 * @throws ContractViolation  if the load exceeds MAX_AGENT_LOAD.
 */
int requiredAgents(double callsPerHour, double avgDurationSeconds, double utilization);

/**
 * @brief Uncapped agents per active hour for a uniformly spread requirement.
 *
 * Convenience used for reporting and for checking a schedule against the
 * per-customer formula.
 */
int requiredAgentsPerHour(const CustomerRequirement& req, double utilization);
