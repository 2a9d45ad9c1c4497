#pragma once

#include "pr/pr_state.h"
#include "pr/transition.h"
#include "tools/pr_tool.h"

namespace MpathPr {

/**
 * Issues the PR commands for one planned operation and returns the state
 * that results. `local` is the multipath map, `peer` the second path.
 * A failing command throws; the state passed in is then still the last
 * state known to be good.
 */
class CommandExecutor {
public:
    CommandExecutor(IPrTool& local, IPrTool& peer) : local_(local), peer_(peer) {}

    PrState Execute(const PrState& state, const PlannedOperation& plan);

    /**
     * Best-effort removal of both initiators' registrations (and with them
     * the reservation). Returns false if any command failed; never throws.
     */
    bool ClearAllRegistrations();

private:
    friend struct ExecuteVisitor;

    void RegisterLocal(const PrState& state, KeyChange change, bool ignore_existing);
    void RegisterPeer(const PrState& state);

    IPrTool& local_;
    IPrTool& peer_;
};

} // namespace MpathPr
