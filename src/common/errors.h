#pragma once

#include <stdexcept>
#include <string>

namespace MpathPr {

/**
 * Root of every fatal condition raised by the harness.
 * The driver catches this type, logs it and runs the cleanup path.
 */
class PrTestError : public std::runtime_error {
public:
    explicit PrTestError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Transient condition reported by the PR tool (Unit Attention).
 * Only this error is retried locally.
 */
class RetryableTransient : public PrTestError {
public:
    explicit RetryableTransient(const std::string& what) : PrTestError(what) {}
};

// Tracked state and reported state disagree.
class StateMismatch : public PrTestError {
public:
    explicit StateMismatch(const std::string& what) : PrTestError(what) {}
};

// The two access paths do not resolve to the same storage.
class IdentifierMismatch : public PrTestError {
public:
    explicit IdentifierMismatch(const std::string& what) : PrTestError(what) {}
};

// The I/O oracle or the path-failure injector died or exited uncleanly.
class BackgroundProcessFault : public PrTestError {
public:
    explicit BackgroundProcessFault(const std::string& what) : PrTestError(what) {}
};

// Any other non-success from an external call, including unparseable output.
class ToolInvocationFailure : public PrTestError {
public:
    explicit ToolInvocationFailure(const std::string& what) : PrTestError(what) {}
};

class ConfigError : public PrTestError {
public:
    explicit ConfigError(const std::string& what) : PrTestError(what) {}
};

} // namespace MpathPr
