#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>
#include <vector>


///////////////////////////
///      CONSTANTS      ///
///////////////////////////
// Day grid: 24 one-hour buckets in a single fixed timezone.
static constexpr int HOURS_PER_DAY = 24;
static constexpr double SECONDS_PER_HOUR = 3600.0;

// Priority scale: 1 is served first, 5 last.
static constexpr int HIGHEST_PRIORITY = 1;
static constexpr int LOWEST_PRIORITY = 5;


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Shape of the planning day.
 *
 * Every stage that enumerates hours (expansion, allocation, aggregation)
 * takes its bounds from here instead of a global constant, so tests can
 * plan over a shorter or differently labelled day.
 */
struct DayGrid {
    int hoursPerDay = HOURS_PER_DAY; ///< Number of one-hour buckets in the day.
    std::string zoneLabel = "PT"; ///< Timezone the hour buckets are expressed in.
};

/**
 * @brief One customer's staffing requirement for the day.
 *
 * Produced by the input layer after validation. The active window is the
 * half-open hour range [startHour, endHour).
 */
struct CustomerRequirement {
    std::string name; ///< Customer name, unique within a run.
    double avgDurationSeconds; ///< Average handling time of one call.
    int startHour; ///< First active hour (inclusive).
    int endHour; ///< End of the active window (exclusive).
    int totalCalls; ///< Call volume expected over the whole window.
    int priority; ///< 1 (highest) .. 5 (lowest).

    /// Number of active hours in the window.
    int activeHours() const { return endHour - startHour; }

    /// True if @p hour lies inside [startHour, endHour).
    bool coversHour(int hour) const { return hour >= startHour && hour < endHour; }
};

/**
 * @brief Call demand of one customer in one hour bucket.
 *
 * originalCalls is fixed at expansion time and kept for auditing;
 * currentCalls is what allocation works on and may differ after calls
 * are moved between hours of the same customer.
 */
struct HourlyDemand {
    int customerIndex; ///< Index of the owning customer in the ledger.
    int hour; ///< Hour bucket [hour:00, hour+1:00).
    double originalCalls; ///< Calls assigned by the expander.
    double currentCalls; ///< Calls after redistribution.
};
