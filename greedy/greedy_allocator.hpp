#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "demand.hpp"
#include "allocation.hpp"


///////////////////////////
///     ALLOCATORS      ///
///////////////////////////
/**
 * @brief Strict priority allocation, each hour on its own.
 *
 * For every hour, customers with demand are served priority 1 first (ties
 * in input order) until the ceiling is reached. A customer that does not
 * fit receives the remaining agents and everyone after it receives none.
 * Spare capacity in one hour is never lent to another, and the ledger is
 * left unchanged.
 */
class GreedyAllocator : public IAllocator {
public:
    AllocationResult allocate(DemandLedger& ledger, int capacity) override;

    std::string name() const override { return "greedy"; }
};
