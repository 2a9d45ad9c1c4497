#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "absl/container/btree_set.h"
#include "common/key.h"

namespace MpathPr {

/**
 * Registered keys as reported by READ KEYS (`-ik`).
 * A key registered through several I_T nexuses (one per multipath path)
 * is listed once per nexus; `registrations` counts those lines.
 */
struct KeyReport {
    absl::btree_set<Key> keys;
    size_t registrations = 0;

    bool Contains(Key key) const { return keys.contains(key); }
    bool Empty() const { return registrations == 0; }
};

/**
 * Reservation as reported by READ RESERVATION (`-ir`).
 */
struct ReservationReport {
    std::optional<Key> key;

    bool Held() const { return key.has_value(); }
};

/**
 * Parses sg_persist / mpathpersist READ KEYS output:
 *
 *   PR generation=0x6, 2 registered reservation keys follow:
 *     0x2
 *     0x1
 *
 * or "there are NO registered reservation keys" / "0 registered reservation
 * key". Throws ToolInvocationFailure on unrecognized output or when the
 * announced count does not match the listed keys.
 */
KeyReport ParseKeyReport(const std::string& output);

/**
 * Parses READ RESERVATION output: "there is NO reservation held" or a
 * "Key = 0x2" line after "Reservation follows:".
 */
ReservationReport ParseReservationReport(const std::string& output);

std::string DescribeKeys(const KeyReport& report);

} // namespace MpathPr
