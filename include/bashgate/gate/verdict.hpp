#ifndef bashgate_GATE_VERDICT_HPP
#define bashgate_GATE_VERDICT_HPP

#include "execution.hpp"
#include <string>

namespace bashgate {

// Outcome of one validation layer. A denial always carries a message that
// says what was rejected and what would have been accepted.
struct Verdict {
    bool allowed;
    ErrorKind kind;
    std::string message;

    Verdict() : allowed(false), kind(ErrorKind::NONE) {}

    static Verdict allow() {
        Verdict v;
        v.allowed = true;
        return v;
    }

    static Verdict deny(ErrorKind kind, const std::string& message) {
        Verdict v;
        v.allowed = false;
        v.kind = kind;
        v.message = message;
        return v;
    }
};

} // namespace bashgate

#endif // bashgate_GATE_VERDICT_HPP
