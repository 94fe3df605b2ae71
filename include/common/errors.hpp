#pragma once

#include <stdexcept>
#include <string>

namespace gate {

/**
 * Error taxonomy.
 *
 * The pure core reports invariant breaches as DENY/FORCE verdicts and
 * emergencies as a latched HaltReason. Exceptions are reserved for
 * illegal lifecycle transitions, malformed input and bad configuration.
 */
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

// Transition outside the legal lifecycle table
class IllegalTransition : public EngineError {
public:
    explicit IllegalTransition(const std::string& what) : EngineError(what) {}
};

// Missing/stale primitives or an admissibility contract breach
class DataIntegrityFailure : public EngineError {
public:
    explicit DataIntegrityFailure(const std::string& what) : EngineError(what) {}
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& what) : EngineError(what) {}
};

} // namespace gate
