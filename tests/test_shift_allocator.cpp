#include <gtest/gtest.h>

#include "shift_allocator.hpp"
#include "report.hpp"
#include "test_helpers.hpp"

#include <vector>

TEST(ShiftAllocatorTest, ScenarioOverflowMovesToNearestHour) {
    // Hour 9 needs 5 agents, hour 10 needs 1, ceiling 3.
    DemandLedger ledger({makeCustomer("A", 3600, 9, 11, 6, 1)}, {{5.0, 1.0}}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 3);

    EXPECT_EQ(result.hours[9].totalAgents(), 3);
    EXPECT_EQ(result.hours[10].totalAgents(), 3);
    EXPECT_EQ(result.hours[9].unmetAgents(), 0);
    EXPECT_EQ(result.hours[10].unmetAgents(), 0);

    ASSERT_EQ(result.moves.size(), 1u);
    EXPECT_EQ(result.moves[0].customerIndex, 0);
    EXPECT_EQ(result.moves[0].fromHour, 9);
    EXPECT_EQ(result.moves[0].toHour, 10);
    EXPECT_DOUBLE_EQ(result.moves[0].calls, 2.0);

    // Only currentCalls moved.
    const HourlyDemand& nine = ledger.record(ledger.recordAt(0, 9));
    const HourlyDemand& ten = ledger.record(ledger.recordAt(0, 10));
    EXPECT_DOUBLE_EQ(nine.currentCalls, 3.0);
    EXPECT_DOUBLE_EQ(ten.currentCalls, 3.0);
    EXPECT_DOUBLE_EQ(nine.originalCalls, 5.0);
    EXPECT_DOUBLE_EQ(ten.originalCalls, 1.0);
}

TEST(ShiftAllocatorTest, LowPriorityAbsorbsOverflowHighPriorityStaysEven) {
    DemandLedger ledger({makeCustomer("HighPriority", 3600, 9, 11, 100, 1),
                         makeCustomer("LowPriority", 3600, 9, 13, 240, 5)}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 100);

    for (int hour = 9; hour < 11; ++hour) {
        EXPECT_EQ(servedAgents(result.hours[hour], 0), 50) << "hour " << hour;
        EXPECT_EQ(servedAgents(result.hours[hour], 1), 50) << "hour " << hour;
    }
    EXPECT_EQ(servedAgents(result.hours[11], 1), 80);
    EXPECT_EQ(servedAgents(result.hours[12], 1), 60);

    for (const HourAllocation& hour : result.hours) {
        EXPECT_LE(hour.totalAgents(), 100);
        EXPECT_EQ(hour.unmetAgents(), 0);
    }

    ASSERT_FALSE(result.moves.empty());
    for (const CallMove& m : result.moves) {
        EXPECT_EQ(m.customerIndex, 1);
    }
    EXPECT_DOUBLE_EQ(ledger.customerCalls(1), 240.0);
}

TEST(ShiftAllocatorTest, NoSpareHoursLeavesUnmetDemand) {
    DemandLedger ledger({makeCustomer("Test", 3600, 9, 13, 400, 1)}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 80);

    int total = 0;
    int unmet = 0;
    for (const HourAllocation& hour : result.hours) {
        total += hour.totalAgents();
        unmet += hour.unmetAgents();
    }
    EXPECT_EQ(total, 320);
    EXPECT_EQ(unmet, 80);
    EXPECT_TRUE(result.moves.empty());
}

TEST(ShiftAllocatorTest, NothingMovesUnderCapacity) {
    DemandLedger ledger({makeCustomer("Test", 3600, 9, 13, 40, 1)}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 100);

    EXPECT_TRUE(result.moves.empty());
    EXPECT_EQ(result.hours[9].totalAgents(), 10);
}

TEST(ShiftAllocatorTest, EqualDistanceTieGoesToEarlierHour) {
    DemandLedger ledger({makeCustomer("A", 3600, 8, 11, 6, 1)}, {{0.0, 6.0, 0.0}}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 4);

    ASSERT_EQ(result.moves.size(), 1u);
    EXPECT_EQ(result.moves[0].toHour, 8);
    EXPECT_EQ(result.hours[8].totalAgents(), 2);
    EXPECT_EQ(result.hours[9].totalAgents(), 4);
    EXPECT_EQ(result.hours[10].totalAgents(), 0);
}

TEST(ShiftAllocatorTest, OverflowSpreadsOverSeveralHoursNearestFirst) {
    DemandLedger ledger({makeCustomer("A", 3600, 9, 13, 10, 2)}, {{10.0, 0.0, 0.0, 0.0}}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 4);

    EXPECT_EQ(result.hours[9].totalAgents(), 4);
    EXPECT_EQ(result.hours[10].totalAgents(), 4);
    EXPECT_EQ(result.hours[11].totalAgents(), 2);
    EXPECT_EQ(result.hours[12].totalAgents(), 0);

    ASSERT_EQ(result.moves.size(), 2u);
    EXPECT_EQ(result.moves[0].toHour, 10);
    EXPECT_EQ(result.moves[1].toHour, 11);
}

TEST(ShiftAllocatorTest, FullHourIsNotRaidedForMovedCalls) {
    // High fills 10:00 exactly; Low overflows 09:00 but may only move to 10:00.
    DemandLedger ledger({makeCustomer("High", 3600, 10, 11, 5, 1),
                         makeCustomer("Low", 3600, 9, 11, 8, 3)}, {{5.0}, {8.0, 0.0}}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 5);

    EXPECT_TRUE(result.moves.empty());
    EXPECT_EQ(servedAgents(result.hours[10], 0), 5);
    EXPECT_EQ(servedAgents(result.hours[9], 1), 5);
    EXPECT_EQ(unmetAgents(result.hours[9], 1), 3);
}

TEST(ShiftAllocatorTest, HighPriorityIsNotMovedToMakeRoomForLowPriority) {
    // Low cannot leave 10:00; High could, but is protected in that hour.
    DemandLedger ledger({makeCustomer("High", 3600, 10, 12, 8, 1),
                         makeCustomer("Low", 3600, 10, 11, 4, 5)}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 5);

    EXPECT_TRUE(result.moves.empty());
    EXPECT_DOUBLE_EQ(ledger.record(ledger.recordAt(0, 10)).currentCalls, 4.0);
    EXPECT_EQ(servedAgents(result.hours[10], 0), 4);
    EXPECT_EQ(servedAgents(result.hours[10], 1), 1);
    EXPECT_EQ(unmetAgents(result.hours[10], 1), 3);
}

TEST(ShiftAllocatorTest, ConservesVolumeAndStaysInWindows) {
    std::vector<CustomerRequirement> customers = {
            makeCustomer("Stanford Hospital", 300, 9, 19, 20000, 1),
            makeCustomer("VNS", 120, 6, 13, 40500, 1),
            makeCustomer("Kaiser", 240, 7, 17, 35000, 2),
            makeCustomer("Mount Sinai", 180, 8, 18, 18000, 3),
            makeCustomer("Cedars", 420, 10, 16, 6000, 4),
            makeCustomer("One Medical", 150, 5, 23, 9000, 5)
    };
    DemandLedger ledger(customers, 0.85);
    ShiftAllocator allocator;
    const int capacity = 700;
    AllocationResult result = allocator.allocate(ledger, capacity);

    EXPECT_NO_THROW(ledger.checkInvariants());
    for (int c = 0; c < ledger.customerCount(); ++c) {
        EXPECT_NEAR(ledger.customerCalls(c), customers[c].totalCalls, 1e-6);
    }
    for (const CallMove& m : result.moves) {
        EXPECT_TRUE(customers[m.customerIndex].coversHour(m.fromHour));
        EXPECT_TRUE(customers[m.customerIndex].coversHour(m.toHour));
        EXPECT_GT(m.calls, 0.0);
    }
    for (const HourAllocation& hour : result.hours) {
        EXPECT_LE(hour.totalAgents(), capacity) << "hour " << hour.hour;
        for (const CustomerHourAllocation& c : hour.customers) {
            EXPECT_TRUE(customers[c.customerIndex].coversHour(hour.hour));
        }
    }
}

TEST(ShiftAllocatorTest, ServesAtLeastAsMuchAsGreedyOnSameDemand) {
    DemandLedger ledger({makeCustomer("A", 3600, 9, 13, 20, 1)}, {{12.0, 4.0, 2.0, 2.0}}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 5);

    std::vector<AllocationReport> reports = buildReports(ledger, result);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].servedCalls, 20);
    EXPECT_EQ(reports[0].unmetCalls, 0);
}

TEST(ShiftAllocatorTest, EqualPrioritiesInOverflowHourAllMayMove) {
    // Same priority everywhere, so nobody is protected; A is tried first.
    DemandLedger ledger({makeCustomer("A", 3600, 9, 11, 2, 2),
                         makeCustomer("B", 3600, 9, 11, 6, 2)}, {{2.0, 0.0}, {6.0, 0.0}}, 1.0);
    ShiftAllocator allocator;
    AllocationResult result = allocator.allocate(ledger, 5);

    ASSERT_EQ(result.moves.size(), 2u);
    EXPECT_EQ(result.moves[0].customerIndex, 0);
    EXPECT_DOUBLE_EQ(result.moves[0].calls, 2.0);
    EXPECT_EQ(result.moves[1].customerIndex, 1);
    EXPECT_DOUBLE_EQ(result.moves[1].calls, 1.0);
    for (const CallMove& m : result.moves) {
        EXPECT_EQ(m.fromHour, 9);
        EXPECT_EQ(m.toHour, 10);
    }

    EXPECT_EQ(servedAgents(result.hours[9], 1), 5);
    EXPECT_EQ(servedAgents(result.hours[10], 0), 2);
    EXPECT_EQ(servedAgents(result.hours[10], 1), 1);
    EXPECT_EQ(result.hours[9].unmetAgents(), 0);
    EXPECT_EQ(result.hours[10].unmetAgents(), 0);
}
