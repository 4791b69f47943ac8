#include <gtest/gtest.h>

#include "planner.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <vector>

namespace {

std::vector<CustomerRequirement> sampleCustomers() {
    return {
            makeCustomer("Stanford Hospital", 300, 9, 19, 20000, 1),
            makeCustomer("VNS", 120, 6, 13, 40500, 1),
            makeCustomer("Kaiser Permanente", 240, 7, 17, 35000, 2),
            makeCustomer("Mount Sinai", 180, 8, 18, 18000, 3),
            makeCustomer("Cedars Sinai", 420, 10, 16, 6000, 4),
            makeCustomer("One Medical", 150, 17, 23, 9000, 5)
    };
}

PlannerConfig cappedConfig(int capacity, Algorithm algorithm, double utilization = 1.0) {
    PlannerConfig config;
    config.utilization = utilization;
    config.capacity = capacity;
    config.algorithm = algorithm;
    return config;
}

}  // namespace

TEST(PlannerTest, SingleCustomerUncapped) {
    StaffingPlan plan = planStaffing({makeCustomer("A", 120, 9, 17, 100, 1)}, PlannerConfig());

    ASSERT_EQ(plan.schedule.hours.size(), 24u);
    for (int hour = 9; hour < 17; ++hour) {
        ASSERT_EQ(plan.schedule.hours[hour].customers.size(), 1u);
        EXPECT_EQ(plan.schedule.hours[hour].customers[0].customer, "A");
        EXPECT_EQ(plan.schedule.hours[hour].customers[0].agents, 1);
    }
    EXPECT_EQ(plan.schedule.hours[8].totalAgents, 0);
    EXPECT_EQ(plan.schedule.hours[17].totalAgents, 0);
    EXPECT_FALSE(plan.capacityConstrained());
    EXPECT_TRUE(plan.moves.empty());

    ASSERT_EQ(plan.reports.size(), 1u);
    EXPECT_EQ(plan.reports[0].servedCalls, 100);
    EXPECT_EQ(plan.reports[0].unmetCalls, 0);
}

TEST(PlannerTest, UtilizationRaisesStaffing) {
    std::vector<CustomerRequirement> customers = {makeCustomer("A", 300, 0, 24, 24000, 1)};
    PlannerConfig full;
    PlannerConfig eightyFive;
    eightyFive.utilization = 0.85;

    EXPECT_EQ(planStaffing(customers, full).schedule.hours[0].totalAgents, 84);
    // 83.33 / 0.85 = 98.04
    EXPECT_EQ(planStaffing(customers, eightyFive).schedule.hours[0].totalAgents, 99);
}

TEST(PlannerTest, GreedyScenarioThroughPlanner) {
    StaffingPlan plan = planStaffing({makeCustomer("X", 3600, 9, 10, 2, 1),
                                      makeCustomer("Y", 3600, 9, 10, 2, 2)},
                                     cappedConfig(1, Algorithm::GREEDY));

    EXPECT_TRUE(plan.capacityConstrained());
    EXPECT_EQ(plan.schedule.hours[9].totalAgents, 1);
    EXPECT_EQ(plan.schedule.unmetAgentHours(), 3);
    EXPECT_EQ(plan.reports[1].servedCalls, 0);
}

TEST(PlannerTest, ShiftScenarioThroughLedger) {
    DemandLedger ledger({makeCustomer("A", 3600, 9, 11, 6, 1)}, {{5.0, 1.0}}, 1.0);
    StaffingPlan plan = planStaffing(ledger, cappedConfig(3, Algorithm::SHIFT));

    EXPECT_EQ(plan.schedule.hours[9].totalAgents, 3);
    EXPECT_EQ(plan.schedule.hours[10].totalAgents, 3);
    EXPECT_EQ(plan.schedule.unmetAgentHours(), 0);
    ASSERT_EQ(plan.moves.size(), 1u);
    ASSERT_EQ(plan.customerNames.size(), 1u);
    EXPECT_EQ(plan.customerNames[plan.moves[0].customerIndex], "A");
    EXPECT_EQ(plan.algorithm, Algorithm::SHIFT);
}

TEST(PlannerTest, AmpleCapacityMatchesUncapped) {
    std::vector<CustomerRequirement> customers = sampleCustomers();
    StaffingPlan uncapped = planStaffing(customers, PlannerConfig());
    int peak = uncapped.schedule.peakAgents();

    for (Algorithm algorithm : {Algorithm::GREEDY, Algorithm::SHIFT}) {
        StaffingPlan capped = planStaffing(customers, cappedConfig(peak, algorithm));
        EXPECT_TRUE(capped.moves.empty()) << algorithmName(algorithm);
        EXPECT_EQ(capped.schedule.unmetAgentHours(), 0) << algorithmName(algorithm);
        for (int hour = 0; hour < 24; ++hour) {
            EXPECT_EQ(capped.schedule.hours[hour].totalAgents, uncapped.schedule.hours[hour].totalAgents)
                    << algorithmName(algorithm) << " hour " << hour;
        }
    }
}

TEST(PlannerTest, RunsAreIdempotent) {
    std::vector<CustomerRequirement> customers = sampleCustomers();
    for (Algorithm algorithm : {Algorithm::GREEDY, Algorithm::SHIFT}) {
        PlannerConfig config = cappedConfig(500, algorithm, 0.85);
        StaffingPlan first = planStaffing(customers, config);
        StaffingPlan second = planStaffing(customers, config);

        ASSERT_EQ(first.moves.size(), second.moves.size());
        for (int hour = 0; hour < 24; ++hour) {
            EXPECT_EQ(first.schedule.hours[hour].totalAgents, second.schedule.hours[hour].totalAgents);
            EXPECT_EQ(first.schedule.hours[hour].customers.size(), second.schedule.hours[hour].customers.size());
        }
        for (size_t i = 0; i < first.reports.size(); ++i) {
            EXPECT_EQ(first.reports[i].servedCalls, second.reports[i].servedCalls);
        }
    }
}

TEST(PlannerTest, CallsAreAccountedForUnderBothPolicies) {
    std::vector<CustomerRequirement> customers = sampleCustomers();
    for (Algorithm algorithm : {Algorithm::GREEDY, Algorithm::SHIFT}) {
        StaffingPlan plan = planStaffing(customers, cappedConfig(300, algorithm));

        ASSERT_EQ(plan.reports.size(), customers.size());
        for (size_t i = 0; i < customers.size(); ++i) {
            const AllocationReport& r = plan.reports[i];
            EXPECT_EQ(r.customer, customers[i].name);
            EXPECT_EQ(r.requestedCalls, customers[i].totalCalls);
            EXPECT_EQ(r.servedCalls + r.unmetCalls, r.requestedCalls);
            EXPECT_GE(r.utilization, 0.0);
            EXPECT_LE(r.utilization, 1.0);
        }
        for (const ScheduleEntry& e : plan.schedule.hours) {
            EXPECT_LE(e.totalAgents, 300);
        }
    }
}

TEST(PlannerTest, ShiftNeverServesFewerAgentHoursThanGreedy) {
    std::vector<CustomerRequirement> customers = sampleCustomers();
    StaffingPlan greedy = planStaffing(customers, cappedConfig(350, Algorithm::GREEDY));
    StaffingPlan shift = planStaffing(customers, cappedConfig(350, Algorithm::SHIFT));

    EXPECT_GE(shift.schedule.totalAgentHours(), greedy.schedule.totalAgentHours());
    EXPECT_FALSE(shift.moves.empty());
}

TEST(PlannerTest, EmptyCustomerListGivesEmptyDay) {
    StaffingPlan plan = planStaffing(std::vector<CustomerRequirement>(), PlannerConfig());

    ASSERT_EQ(plan.schedule.hours.size(), 24u);
    EXPECT_EQ(plan.schedule.totalAgentHours(), 0);
    EXPECT_TRUE(plan.reports.empty());
}

TEST(PlannerTest, RejectsInvalidConfiguration) {
    std::vector<CustomerRequirement> customers = {makeCustomer("A", 120, 9, 17, 100, 1)};

    PlannerConfig zeroUtil;
    zeroUtil.utilization = 0.0;
    EXPECT_THROW(planStaffing(customers, zeroUtil), ConfigurationError);

    PlannerConfig negativeUtil;
    negativeUtil.utilization = -0.5;
    EXPECT_THROW(planStaffing(customers, negativeUtil), ConfigurationError);

    EXPECT_THROW(planStaffing(customers, cappedConfig(-1, Algorithm::GREEDY)), ConfigurationError);
    EXPECT_NO_THROW(planStaffing(customers, cappedConfig(0, Algorithm::SHIFT)));
}

TEST(PlannerTest, RejectsBrokenRequirementBeforePlanning) {
    std::vector<CustomerRequirement> customers = {makeCustomer("A", 120, 9, 17, 100, 1),
                                                  makeCustomer("B", 120, 9, 17, 100, 9)};
    EXPECT_THROW(planStaffing(customers, PlannerConfig()), ContractViolation);
}

TEST(PlannerTest, AlgorithmNames) {
    EXPECT_EQ(parseAlgorithm("greedy"), Algorithm::GREEDY);
    EXPECT_EQ(parseAlgorithm("shift"), Algorithm::SHIFT);
    EXPECT_THROW(parseAlgorithm("optimal"), ConfigurationError);
    EXPECT_THROW(parseAlgorithm("Greedy"), ConfigurationError);

    EXPECT_EQ(algorithmName(Algorithm::SHIFT), "shift");
    EXPECT_EQ(makeAllocator(Algorithm::GREEDY)->name(), "greedy");
    EXPECT_EQ(makeAllocator(Algorithm::SHIFT)->name(), "shift");
}

TEST(PlannerTest, OversizedDemandFailsBeforeAnyPlan) {
    std::vector<CustomerRequirement> customers = {makeCustomer("A", 3600, 9, 10, 600000000, 1),
                                                  makeCustomer("B", 3600, 9, 10, 600000000, 2)};
    EXPECT_THROW(planStaffing(customers, PlannerConfig()), ContractViolation);
    EXPECT_THROW(planStaffing(customers, cappedConfig(10, Algorithm::GREEDY)), ContractViolation);
}

TEST(PlannerTest, PlanCarriesDayGrid) {
    StaffingPlan plan = planStaffing({makeCustomer("A", 120, 9, 17, 100, 1)}, PlannerConfig());
    EXPECT_EQ(plan.grid.hoursPerDay, 24);
    EXPECT_EQ(plan.grid.zoneLabel, "PT");
}
