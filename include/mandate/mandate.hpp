#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include "common/types.hpp"

namespace gate {

/**
 * Optional execution parameters carried by a mandate.
 */
struct MandateScope {
    std::optional<double> reduce_fraction;       // REDUCE: (0, 1) of current size
    std::optional<Size> quantity;                // Explicit quantity request
    std::optional<Price> limit_price;            // ENTER/ADD: LIMIT order
    std::optional<Price> stop_price;             // Protective stop
    std::optional<Price> entry_trigger_price;    // ENTER/ADD: STOP entry
};

/**
 * Typed, ephemeral permission proposal for one action class on one symbol.
 *
 * Lives for a single cycle. Never persisted, merged or carried over.
 */
struct Mandate {
    MandateType type{MandateType::HOLD};
    std::string symbol;
    Direction direction{Direction::NONE};
    int authority_rank{0};
    std::vector<PositionState> preconditions;    // Empty = lifecycle table default
    MandateScope scope;
    std::optional<uint64_t> expiry_cycle;        // Invalid after this cycle
    std::string trigger_id;
    MandateOrigin origin{MandateOrigin::STRATEGY};

    bool is_forced() const { return origin != MandateOrigin::STRATEGY; }
};

// Fixed global order: EXIT > REDUCE > BLOCK > HOLD > ADD > ENTER
inline int authority_of(MandateType t) {
    switch (t) {
        case MandateType::EXIT: return 6;
        case MandateType::REDUCE: return 5;
        case MandateType::BLOCK: return 4;
        case MandateType::HOLD: return 3;
        case MandateType::ADD: return 2;
        case MandateType::ENTER: return 1;
    }
    return 0;
}

struct MandateCheck {
    bool valid{true};
    DiscardReason reason{DiscardReason::MALFORMED};
    std::string detail;
};

/**
 * Structural check of an untrusted mandate before arbitration.
 * Fails with EXPIRED when the expiry cycle has passed, MALFORMED otherwise.
 */
MandateCheck validate_mandate(const Mandate& m, const std::string& symbol, uint64_t cycle);

// Strategy-originated mandate with its authority filled in
Mandate make_mandate(MandateType type,
                     const std::string& symbol,
                     Direction direction,
                     const std::string& trigger_id);

// Mandate injected by a FORCE verdict. Trigger id: force:<type>:<symbol>:<cycle>
Mandate make_forced(MandateType type,
                    const std::string& symbol,
                    Direction direction,
                    uint64_t cycle,
                    std::optional<Size> quantity = std::nullopt);

// BLOCK (OPEN) or HOLD (FLAT) injected on a data integrity failure
Mandate make_integrity_mandate(MandateType type, const std::string& symbol, uint64_t cycle);

// Best-effort EXIT injected while halted
Mandate make_halt_exit(const std::string& symbol, Direction direction, uint64_t cycle);

} // namespace gate
