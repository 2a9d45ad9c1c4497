#include "legality.h"

#include <algorithm>

namespace MpathPr {

std::vector<Operation> LegalOperations(const PrState& state) {
    if (!state.LocalRegistered()) {
        return {Register{KeyChange::kNewKey}, RegisterIgnore{KeyChange::kNewKey}};
    }

    std::vector<Operation> ops = {
        Register{KeyChange::kNewKey},
        Register{KeyChange::kUnregister},
        RegisterIgnore{KeyChange::kNewKey},
        RegisterIgnore{KeyChange::kUnregister},
        Release{},
        Clear{},
        Preempt{Initiator::kLocal},
        Preempt{Initiator::kPeer},
    };
    if (state.holder == Holder::kNone || state.holder == Holder::kLocal) {
        ops.push_back(Reserve{});
    }
    return ops;
}

bool IsLegal(const PrState& state, const Operation& op) {
    const auto ops = LegalOperations(state);
    return std::find(ops.begin(), ops.end(), op) != ops.end();
}

} // namespace MpathPr
