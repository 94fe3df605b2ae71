#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace gate {

// Time types (journal and logging only, never read by the pure core)
using WallClock = std::chrono::time_point<std::chrono::system_clock>;

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

using Price = double;
using Size = double;
using Notional = double;

// Tolerance for every comparison against a cap
constexpr double kEpsilon = 1e-9;

// Position direction
enum class Direction {
    NONE,
    LONG,
    SHORT
};

inline std::string direction_to_string(Direction d) {
    switch (d) {
        case Direction::NONE: return "NONE";
        case Direction::LONG: return "LONG";
        case Direction::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}

std::optional<Direction> direction_from_string(const std::string& s);

// +1 for LONG, -1 for SHORT, 0 otherwise
inline double direction_sign(Direction d) {
    switch (d) {
        case Direction::LONG: return 1.0;
        case Direction::SHORT: return -1.0;
        case Direction::NONE: return 0.0;
    }
    return 0.0;
}

// Position lifecycle (closed set)
enum class PositionState {
    FLAT,
    ENTERING,
    OPEN,
    REDUCING,
    CLOSING,
    CLOSED,
    FAILED
};

constexpr int kPositionStateCount = 7;

inline std::string position_state_to_string(PositionState s) {
    switch (s) {
        case PositionState::FLAT: return "FLAT";
        case PositionState::ENTERING: return "ENTERING";
        case PositionState::OPEN: return "OPEN";
        case PositionState::REDUCING: return "REDUCING";
        case PositionState::CLOSING: return "CLOSING";
        case PositionState::CLOSED: return "CLOSED";
        case PositionState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<PositionState> position_state_from_string(const std::string& s);

// Mandate taxonomy
enum class MandateType {
    ENTER,
    ADD,
    REDUCE,
    EXIT,
    BLOCK,
    HOLD
};

constexpr int kMandateTypeCount = 6;

inline std::string mandate_type_to_string(MandateType t) {
    switch (t) {
        case MandateType::ENTER: return "ENTER";
        case MandateType::ADD: return "ADD";
        case MandateType::REDUCE: return "REDUCE";
        case MandateType::EXIT: return "EXIT";
        case MandateType::BLOCK: return "BLOCK";
        case MandateType::HOLD: return "HOLD";
    }
    return "UNKNOWN";
}

std::optional<MandateType> mandate_type_from_string(const std::string& s);

// Who produced a mandate
enum class MandateOrigin {
    STRATEGY,   // External strategy/condition layer (untrusted)
    INVARIANT,  // Injected by a FORCE verdict
    INTEGRITY,  // Injected on data integrity failure
    HALT        // Injected by halt supremacy
};

inline std::string mandate_origin_to_string(MandateOrigin o) {
    switch (o) {
        case MandateOrigin::STRATEGY: return "STRATEGY";
        case MandateOrigin::INVARIANT: return "INVARIANT";
        case MandateOrigin::INTEGRITY: return "INTEGRITY";
        case MandateOrigin::HALT: return "HALT";
    }
    return "UNKNOWN";
}

std::optional<MandateOrigin> mandate_origin_from_string(const std::string& s);

// Execution intent action
enum class IntentAction {
    OPEN,
    REDUCE,
    CLOSE
};

inline std::string intent_action_to_string(IntentAction a) {
    switch (a) {
        case IntentAction::OPEN: return "OPEN";
        case IntentAction::REDUCE: return "REDUCE";
        case IntentAction::CLOSE: return "CLOSE";
    }
    return "UNKNOWN";
}

std::optional<IntentAction> intent_action_from_string(const std::string& s);

enum class PriceType {
    MARKET,
    LIMIT,
    STOP
};

inline std::string price_type_to_string(PriceType t) {
    switch (t) {
        case PriceType::MARKET: return "MARKET";
        case PriceType::LIMIT: return "LIMIT";
        case PriceType::STOP: return "STOP";
    }
    return "UNKNOWN";
}

std::optional<PriceType> price_type_from_string(const std::string& s);

// Invariant evaluator verdict
enum class VerdictKind {
    ALLOW,
    DENY,
    FORCE_REDUCE,
    FORCE_EXIT
};

inline std::string verdict_kind_to_string(VerdictKind v) {
    switch (v) {
        case VerdictKind::ALLOW: return "ALLOW";
        case VerdictKind::DENY: return "DENY";
        case VerdictKind::FORCE_REDUCE: return "FORCE(REDUCE)";
        case VerdictKind::FORCE_EXIT: return "FORCE(EXIT)";
    }
    return "UNKNOWN";
}

std::optional<VerdictKind> verdict_kind_from_string(const std::string& s);

// Why a mandate did not win arbitration
enum class DiscardReason {
    LOWER_AUTHORITY,
    STATE_INADMISSIBLE,
    INVARIANT_DENIED,
    DIRECTIONAL_AMBIGUITY,
    SUPERSEDED,         // Same tier, lost the tie-break
    HALTED,
    EXPIRED,
    MALFORMED,
    INTENT_SUPPRESSED   // Selected, but no size satisfies every cap
};

inline std::string discard_reason_to_string(DiscardReason r) {
    switch (r) {
        case DiscardReason::LOWER_AUTHORITY: return "lower_authority";
        case DiscardReason::STATE_INADMISSIBLE: return "state_inadmissible";
        case DiscardReason::INVARIANT_DENIED: return "invariant_denied";
        case DiscardReason::DIRECTIONAL_AMBIGUITY: return "directional_ambiguity";
        case DiscardReason::SUPERSEDED: return "superseded";
        case DiscardReason::HALTED: return "halted";
        case DiscardReason::EXPIRED: return "expired";
        case DiscardReason::MALFORMED: return "malformed";
        case DiscardReason::INTENT_SUPPRESSED: return "intent_suppressed";
    }
    return "unknown";
}

std::optional<DiscardReason> discard_reason_from_string(const std::string& s);

} // namespace gate
