#pragma once

#include <vector>

#include "operation.h"
#include "pr_state.h"

namespace MpathPr {

/**
 * Operations that may be issued next from `state`.
 *
 * Unregistered: only the two ways of registering a new key.
 * Registered: every register variant, RELEASE, CLEAR and both preempt
 * directions, plus RESERVE when the reservation is free or already ours.
 * A RESERVE while the peer holds the reservation is a conflict, never issued.
 *
 * Pure; the order of the result is stable so that a seeded run is
 * reproducible.
 */
std::vector<Operation> LegalOperations(const PrState& state);

bool IsLegal(const PrState& state, const Operation& op);

} // namespace MpathPr
