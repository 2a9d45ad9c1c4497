#include "operation.h"

namespace MpathPr {

namespace {

const char* ChangeName(KeyChange change) {
    return change == KeyChange::kNewKey ? "new" : "unregister";
}

struct NameVisitor {
    std::string operator()(const Register& op) const {
        return std::string("REGISTER(") + ChangeName(op.change) + ")";
    }
    std::string operator()(const RegisterIgnore& op) const {
        return std::string("REGISTER_AND_IGNORE(") + ChangeName(op.change) + ")";
    }
    std::string operator()(const Reserve&) const { return "RESERVE"; }
    std::string operator()(const Release&) const { return "RELEASE"; }
    std::string operator()(const Clear&) const { return "CLEAR"; }
    std::string operator()(const Preempt& op) const {
        return std::string("PREEMPT(by-") + InitiatorName(op.by) + ")";
    }
};

} // namespace

std::string OperationName(const Operation& op) {
    return std::visit(NameVisitor{}, op);
}

} // namespace MpathPr
