#include "transition.h"

namespace MpathPr {

namespace {

PrState Unregister(const PrState& state) {
    PrState next = state.WithLocalKey(kNoKey);
    if (state.holder == Holder::kLocal) {
        // Unregistering the holder drops the reservation
        next = next.WithHolder(Holder::kNone);
    }
    return next;
}

PrState ChangeKey(const PrState& state, KeyChange change) {
    return change == KeyChange::kNewKey ? state.WithFreshLocalKey() : Unregister(state);
}

struct TransitionVisitor {
    const PrState& state;
    const PlannedOperation& plan;

    PrState operator()(const Register& op) const { return ChangeKey(state, op.change); }
    PrState operator()(const RegisterIgnore& op) const { return ChangeKey(state, op.change); }
    PrState operator()(const Reserve&) const { return state.WithHolder(Holder::kLocal); }

    PrState operator()(const Release&) const {
        // Releasing a reservation held by someone else is a no-op
        return state.holder == Holder::kLocal ? state.WithHolder(Holder::kNone) : state;
    }

    PrState operator()(const Clear&) const {
        return state.WithLocalKey(kNoKey).WithHolder(Holder::kNone);
    }

    PrState operator()(const Preempt& op) const {
        if (op.by == Initiator::kLocal) {
            Holder holder = state.holder;
            if (holder == Holder::kNone && plan.peer_reserves_first) {
                holder = Holder::kPeer;
            }
            if (holder == Holder::kPeer) {
                holder = Holder::kLocal;
            }
            return state.WithHolder(holder).WithPendingPreemption(state.peer_key);
        }
        PrState next = state.WithPendingPreemption(state.local_key).WithLocalKey(kNoKey);
        if (state.holder == Holder::kLocal) {
            next = next.WithHolder(Holder::kPeer);
        }
        return next;
    }
};

} // namespace

PlannedOperation PlanOperation(const PrState& state, const Operation& op, std::mt19937_64& rng) {
    PlannedOperation plan{op, false};
    const auto* preempt = std::get_if<Preempt>(&op);
    if (preempt != nullptr && preempt->by == Initiator::kLocal && state.holder == Holder::kNone) {
        plan.peer_reserves_first = std::bernoulli_distribution(0.5)(rng);
    }
    return plan;
}

PrState Transition(const PrState& state, const PlannedOperation& plan) {
    return std::visit(TransitionVisitor{state, plan}, plan.op);
}

bool ChangesExpectation(const PrState& state, const PlannedOperation& plan) {
    return ExpectedIo(state) != ExpectedIo(Transition(state, plan));
}

} // namespace MpathPr
