#pragma once

#include <string>
#include "common/types.hpp"

namespace gate {

/**
 * Atomic, fully specified order instruction for the broker adapter.
 * Immutable once emitted; at most one per symbol per cycle.
 */
struct ExecutionIntent {
    std::string symbol;
    IntentAction action{IntentAction::OPEN};
    Direction direction{Direction::NONE};
    Size quantity{0.0};
    PriceType price_type{PriceType::MARKET};
    Price limit_price{0.0};       // LIMIT price or STOP entry trigger, 0 for MARKET
    Price stop_price{0.0};        // Protective stop carried with the position
    MandateType mandate_type{MandateType::HOLD};
    std::string trigger_id;
};

} // namespace gate
