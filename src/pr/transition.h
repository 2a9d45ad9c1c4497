#pragma once

#include <random>

#include "operation.h"
#include "pr_state.h"

namespace MpathPr {

/**
 * An operation with its random choices already made.
 *
 * PREEMPT(by-local) may first let the peer take the free reservation; that
 * coin flip is resolved here so the resulting state is known before any
 * command is issued.
 */
struct PlannedOperation {
    Operation op;
    bool peer_reserves_first = false;
};

PlannedOperation PlanOperation(const PrState& state, const Operation& op, std::mt19937_64& rng);

/**
 * State after `plan` has been carried out successfully.
 */
PrState Transition(const PrState& state, const PlannedOperation& plan);

// True when the I/O oracle has to be restarted around `plan`
bool ChangesExpectation(const PrState& state, const PlannedOperation& plan);

} // namespace MpathPr
