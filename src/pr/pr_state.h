#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "common/key.h"

namespace MpathPr {

enum class Initiator {
    kLocal,  // the multipath map
    kPeer,   // the second path to the same LU
};

enum class Holder {
    kNone,
    kLocal,
    kPeer,
};

enum class IoExpectation {
    kPass,
    kFail,
};

const char* InitiatorName(Initiator initiator);
const char* HolderName(Holder holder);
// "pass" / "fail", as understood by the I/O oracle
const char* ExpectationName(IoExpectation expectation);

/**
 * The reservation state the harness believes the LU is in.
 *
 * Values are never modified in place: every transition returns a new
 * PrState. Invariants:
 *   - local_key == kNoKey iff the local initiator is unregistered
 *   - holder != kNone implies the holder is registered
 *   - next_key only grows and is never handed out twice
 */
struct PrState {
    Key local_key = kNoKey;
    Key peer_key = 0x1;
    Key next_key = 0x2;
    Holder holder = Holder::kNone;
    // Key removed by the last preempt; cleared once verified absent
    std::optional<Key> pending_preemption;

    bool LocalRegistered() const { return local_key != kNoKey; }

    // Key the reservation should be reported under, if any
    std::optional<Key> HolderKey() const;

    PrState WithLocalKey(Key key) const;
    PrState WithHolder(Holder new_holder) const;
    PrState WithPendingPreemption(std::optional<Key> key) const;
    // Hands out next_key as the new local key
    PrState WithFreshLocalKey() const;

    bool operator==(const PrState& other) const;
    bool operator!=(const PrState& other) const { return !(*this == other); }
};

// State right after a verified clear of all registrations
PrState InitialState(Key peer_key, Key first_local_key);

/**
 * Expected outcome of a write through the local path:
 * pass if registered (Registrants-Only), otherwise pass only when
 * nobody holds a reservation.
 */
IoExpectation ExpectedIo(const PrState& state);

std::string DescribeState(const PrState& state);
std::ostream& operator<<(std::ostream& os, const PrState& state);

} // namespace MpathPr
