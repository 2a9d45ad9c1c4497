#pragma once

#include <string>

#include "pr/pr_state.h"
#include "tools/multipath_daemon.h"
#include "tools/pr_tool.h"

namespace MpathPr {

struct VerifyOptions {
    // Cross-check multipathd's getprkey/getprstatus/getprhold
    bool check_multipathd = true;
    // Require the peer path to report the same keys and reservation
    bool cross_check_peer_path = false;
};

/**
 * Compares the tracked state with what the storage stack reports and
 * throws StateMismatch on the first disagreement. Nothing is corrected.
 */
class Verifier {
public:
    // `daemon` and `peer` may be null when the channel is unavailable
    Verifier(IPrTool& local, IMultipathDaemon* daemon, std::string map,
             IPrTool* peer, VerifyOptions options);

    /**
     * Returns `state` with the pending preemption cleared once the
     * preempted key has been confirmed gone.
     */
    PrState Verify(const PrState& state);

    // Start-up check after clearing: no key may be registered at all
    void VerifyCleared();

private:
    void CheckRegistration(const PrState& state, const KeyReport& keys);
    void CheckReservation(const PrState& state, const ReservationReport& reservation);
    void CheckDaemon(const PrState& state);
    void CheckPeerPath(const KeyReport& keys, const ReservationReport& reservation);

    IPrTool& local_;
    IMultipathDaemon* daemon_;
    std::string map_;
    IPrTool* peer_;
    VerifyOptions options_;
};

} // namespace MpathPr
