///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "baseline.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>


///////////////////////////
///      BASELINE       ///
///////////////////////////
double agentLoad(double callsPerHour, double avgDurationSeconds, double utilization) {
    if (!(utilization > 0.0)) {
        std::ostringstream ss;
        ss << "utilization must be positive, got " << utilization;
        throw ConfigurationError(ss.str());
    }
    return callsPerHour * avgDurationSeconds / SECONDS_PER_HOUR / utilization;
}

int requiredAgents(double callsPerHour, double avgDurationSeconds, double utilization) {
    double load = agentLoad(callsPerHour, avgDurationSeconds, utilization);
    if (load <= AGENT_ROUNDING_TOLERANCE) return 0;
    if (!(load <= MAX_AGENT_LOAD)) {
        std::ostringstream ss;
        ss << "agent load " << load << " exceeds the supported maximum of " << MAX_AGENT_LOAD;
        throw ContractViolation(ss.str());
    }
    // Loads less than 1e-9 above a whole number round down to it: 1 + 5e-10
    // staffs 1 agent where an exact ceiling would give 2.
    return (int)std::ceil(load - AGENT_ROUNDING_TOLERANCE);
}

int requiredAgentsPerHour(const CustomerRequirement& req, double utilization) {
    int hours = req.activeHours();
    if (hours <= 0) return 0;
    double callsPerHour = (double)req.totalCalls / hours;
    return requiredAgents(callsPerHour, req.avgDurationSeconds, utilization);
}
