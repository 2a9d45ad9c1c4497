#pragma once

#include <ostream>
#include <string>
#include <variant>

#include "pr_state.h"

namespace MpathPr {

// PROUT type 5: Write Exclusive, Registrants Only
constexpr int kWriteExclusiveRegistrantsOnly = 5;

enum class KeyChange {
    kNewKey,
    kUnregister,
};

struct Register {
    KeyChange change;
};

// REGISTER AND IGNORE EXISTING KEY: no reservation key is sent
struct RegisterIgnore {
    KeyChange change;
};

struct Reserve {};
struct Release {};
struct Clear {};

struct Preempt {
    Initiator by;
};

inline bool operator==(const Register& a, const Register& b) { return a.change == b.change; }
inline bool operator==(const RegisterIgnore& a, const RegisterIgnore& b) { return a.change == b.change; }
inline bool operator==(const Reserve&, const Reserve&) { return true; }
inline bool operator==(const Release&, const Release&) { return true; }
inline bool operator==(const Clear&, const Clear&) { return true; }
inline bool operator==(const Preempt& a, const Preempt& b) { return a.by == b.by; }

using Operation = std::variant<Register, RegisterIgnore, Reserve, Release, Clear, Preempt>;

// e.g. "REGISTER(new)", "PREEMPT(by-peer)"
std::string OperationName(const Operation& op);

inline std::ostream& operator<<(std::ostream& os, const Operation& op) {
    return os << OperationName(op);
}

} // namespace MpathPr
