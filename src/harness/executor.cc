#include "executor.h"

#include <glog/logging.h>
#include "common/errors.h"

namespace MpathPr {

struct ExecuteVisitor {
    CommandExecutor& executor;
    const PrState& state;
    const PlannedOperation& plan;

    void operator()(const Register& op) const {
        executor.RegisterLocal(state, op.change, false);
    }

    void operator()(const RegisterIgnore& op) const {
        executor.RegisterLocal(state, op.change, true);
    }

    void operator()(const Reserve&) const {
        LOG(INFO) << "Executing RESERVE (key=" << FormatKey(state.local_key) << ")";
        executor.local_.Reserve(state.local_key, kWriteExclusiveRegistrantsOnly);
    }

    void operator()(const Release&) const {
        LOG(INFO) << "Executing RELEASE (key=" << FormatKey(state.local_key) << ")";
        executor.local_.Release(state.local_key, kWriteExclusiveRegistrantsOnly);
    }

    void operator()(const Clear&) const {
        LOG(INFO) << "Executing CLEAR (key=" << FormatKey(state.local_key) << ")";
        executor.local_.Clear(state.local_key);
    }

    void operator()(const Preempt& op) const {
        executor.RegisterPeer(state);
        if (op.by == Initiator::kLocal) {
            if (plan.peer_reserves_first && state.holder == Holder::kNone) {
                LOG(INFO) << "Peer grabbing reservation";
                executor.peer_.Reserve(state.peer_key, kWriteExclusiveRegistrantsOnly);
            }
            LOG(INFO) << "Local preempting peer (key=" << FormatKey(state.local_key)
                      << " preempts " << FormatKey(state.peer_key) << ")";
            executor.local_.Preempt(state.local_key, state.peer_key, kWriteExclusiveRegistrantsOnly);
        } else {
            LOG(INFO) << "Peer preempting local (key=" << FormatKey(state.peer_key)
                      << " preempts " << FormatKey(state.local_key) << ")";
            executor.peer_.Preempt(state.peer_key, state.local_key, kWriteExclusiveRegistrantsOnly);
        }
    }
};

void CommandExecutor::RegisterLocal(const PrState& state, KeyChange change, bool ignore_existing) {
    const char* name = ignore_existing ? "REGISTER_AND_IGNORE" : "REGISTER";
    const Key new_key = change == KeyChange::kNewKey ? state.next_key : kNoKey;
    if (change == KeyChange::kUnregister) {
        LOG(INFO) << "Executing " << name << " to unregister local (key="
                  << FormatKey(state.local_key) << " -> 0x0)";
    } else {
        LOG(INFO) << "Executing " << name << " with new key (key="
                  << FormatKey(state.local_key) << " -> " << FormatKey(new_key) << ")";
    }

    if (ignore_existing) {
        local_.RegisterIgnore(new_key);
        return;
    }
    std::optional<Key> reservation_key;
    if (state.LocalRegistered()) {
        reservation_key = state.local_key;
    }
    local_.Register(reservation_key, new_key);
}

void CommandExecutor::RegisterPeer(const PrState& state) {
    // Idempotent: the peer keeps the same key whenever it is registered
    LOG(INFO) << "Registering peer with key " << FormatKey(state.peer_key);
    peer_.RegisterIgnore(state.peer_key);
}

PrState CommandExecutor::Execute(const PrState& state, const PlannedOperation& plan) {
    std::visit(ExecuteVisitor{*this, state, plan}, plan.op);
    PrState next = Transition(state, plan);
    VLOG(1) << OperationName(plan.op) << ": " << state << " => " << next;
    return next;
}

bool CommandExecutor::ClearAllRegistrations() {
    LOG(INFO) << "Clearing all registrations and reservations...";
    bool ok = true;
    // Unregistering the holder releases the reservation as well
    for (IPrTool* tool : {&local_, &peer_}) {
        try {
            tool->RegisterIgnore(kNoKey);
        } catch (const PrTestError& e) {
            LOG(WARNING) << "Unregistering " << tool->device() << " failed: " << e.what();
            ok = false;
        }
    }
    return ok;
}

} // namespace MpathPr
