#include "pr_state.h"

#include "absl/strings/str_cat.h"

namespace MpathPr {

const char* InitiatorName(Initiator initiator) {
    switch (initiator) {
        case Initiator::kLocal: return "local";
        case Initiator::kPeer: return "peer";
    }
    return "unknown";
}

const char* HolderName(Holder holder) {
    switch (holder) {
        case Holder::kNone: return "none";
        case Holder::kLocal: return "local";
        case Holder::kPeer: return "peer";
    }
    return "unknown";
}

const char* ExpectationName(IoExpectation expectation) {
    return expectation == IoExpectation::kPass ? "pass" : "fail";
}

std::optional<Key> PrState::HolderKey() const {
    switch (holder) {
        case Holder::kLocal: return local_key;
        case Holder::kPeer: return peer_key;
        case Holder::kNone: break;
    }
    return std::nullopt;
}

PrState PrState::WithLocalKey(Key key) const {
    PrState next = *this;
    next.local_key = key;
    return next;
}

PrState PrState::WithHolder(Holder new_holder) const {
    PrState next = *this;
    next.holder = new_holder;
    return next;
}

PrState PrState::WithPendingPreemption(std::optional<Key> key) const {
    PrState next = *this;
    next.pending_preemption = key;
    return next;
}

PrState PrState::WithFreshLocalKey() const {
    PrState next = *this;
    next.local_key = next_key;
    next.next_key = next_key + 1;
    return next;
}

bool PrState::operator==(const PrState& other) const {
    return local_key == other.local_key &&
           peer_key == other.peer_key &&
           next_key == other.next_key &&
           holder == other.holder &&
           pending_preemption == other.pending_preemption;
}

PrState InitialState(Key peer_key, Key first_local_key) {
    PrState state;
    state.local_key = kNoKey;
    state.peer_key = peer_key;
    state.next_key = first_local_key;
    state.holder = Holder::kNone;
    return state;
}

IoExpectation ExpectedIo(const PrState& state) {
    if (state.LocalRegistered()) {
        return IoExpectation::kPass;
    }
    return state.holder == Holder::kNone ? IoExpectation::kPass : IoExpectation::kFail;
}

std::string DescribeState(const PrState& state) {
    std::string out = absl::StrCat("local_key=", FormatKey(state.local_key),
                                   " holder=", HolderName(state.holder),
                                   " next_key=", FormatKey(state.next_key));
    if (state.pending_preemption.has_value()) {
        absl::StrAppend(&out, " pending_preemption=", FormatKey(*state.pending_preemption));
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const PrState& state) {
    return os << DescribeState(state);
}

} // namespace MpathPr
