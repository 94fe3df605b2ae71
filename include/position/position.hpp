#pragma once

#include <string>
#include <cstdint>
#include "common/types.hpp"

namespace gate {

/**
 * Position in a single symbol.
 *
 * At most one non-FLAT position exists per symbol. Direction is immutable
 * while non-FLAT; size only grows through risk-validated ENTER/ADD fills.
 */
struct Position {
    std::string symbol;
    Direction direction{Direction::NONE};
    Size size{0.0};
    Price entry_price{0.0};
    Price stop_price{0.0};               // 0 = no protective stop
    PositionState state{PositionState::FLAT};
    Notional risk_reserved{0.0};         // Loss at stop, reserved against equity
    double liquidation_distance{1.0};    // Last evaluated distance, 1.0 when flat
    uint64_t last_update_cycle{0};

    static Position flat(const std::string& symbol) {
        Position p;
        p.symbol = symbol;
        return p;
    }

    bool holds_size() const { return size > kEpsilon; }

    // Signed notional at a mark price
    Notional signed_notional(Price mark) const {
        return direction_sign(direction) * size * mark;
    }
};

// The tighter of two protective stops; 0 means none. A stop only ever moves
// toward the mark.
inline Price tighter_stop(Direction direction, Price current, Price proposed) {
    if (current <= 0) return proposed;
    if (proposed <= 0) return current;
    return direction == Direction::SHORT ? (current < proposed ? current : proposed)
                                         : (current > proposed ? current : proposed);
}

/**
 * Account state captured at cycle start. Passed by value; the ledger is the
 * only place a new snapshot is produced.
 */
struct AccountSnapshot {
    Notional equity{0.0};
    Notional margin_available{0.0};
    Notional realized_pnl{0.0};
    Notional fees_paid{0.0};
    uint64_t sequence{0};
};

enum class ReportStatus {
    ACCEPTED,   // Venue acknowledged the order
    FILLED,     // Terminal fill (filled_quantity may be below the intent quantity)
    REJECTED    // Venue refused or failed the order
};

inline std::string report_status_to_string(ReportStatus s) {
    switch (s) {
        case ReportStatus::ACCEPTED: return "ACCEPTED";
        case ReportStatus::FILLED: return "FILLED";
        case ReportStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

/**
 * Confirmed execution result from the broker adapter. The only input that
 * moves a position through its lifecycle.
 */
struct ExecutionReport {
    std::string symbol;
    IntentAction action{IntentAction::OPEN};
    ReportStatus status{ReportStatus::ACCEPTED};
    Direction direction{Direction::NONE};   // Required for OPEN
    Size filled_quantity{0.0};
    Price fill_price{0.0};
    Price stop_price{0.0};                  // Protective stop attached to OPEN
    Notional fee{0.0};
    std::string trigger_id;
    uint64_t cycle{0};
};

} // namespace gate
