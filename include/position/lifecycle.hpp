#pragma once

#include <optional>
#include <vector>
#include "common/types.hpp"
#include "position/position.hpp"

namespace gate {
namespace lifecycle {

/**
 * Position lifecycle state machine.
 *
 * Legal transitions:
 *   FLAT -> ENTERING -> OPEN
 *   OPEN -> REDUCING -> OPEN
 *   OPEN | REDUCING | ENTERING -> CLOSING -> CLOSED -> FLAT
 *   any state except CLOSED -> FAILED -> CLOSING
 *
 * ENTERING -> CLOSING is the target of an EXIT (cancel) while an entry is in
 * flight. Everything else is a constitutional violation and throws
 * IllegalTransition. Transitions are driven only by confirmed execution
 * results; nothing here looks at time.
 */

bool is_legal_transition(PositionState from, PositionState to);

// Mandates admissible in a lifecycle state
bool is_admissible(PositionState state, MandateType type);
std::vector<MandateType> admissible_mandates(PositionState state);

// Transitions that start an execution need an admissible initiating mandate
bool requires_initiating_mandate(PositionState from, PositionState to);

// State a position enters once the venue accepts an intent with this action.
// ADD keeps OPEN and a further REDUCE keeps REDUCING. nullopt when the action
// has no legal target from this state.
std::optional<PositionState> target_state(PositionState from, IntentAction action);

// Mandate type that initiates an intent action from a state
MandateType initiating_mandate(PositionState from, IntentAction action);

/**
 * Move a position to a new state.
 *
 * Checks transition legality, initiating-mandate admissibility and the
 * direction invariant. Size, price and stop changes are applied by the caller
 * on the returned copy.
 */
Position transition(const Position& current,
                    PositionState to,
                    std::optional<MandateType> initiating = std::nullopt);

/**
 * Size after a confirmed fill.
 *
 * OPEN fills add to the size. REDUCE fills must strictly decrease it and
 * never cross zero. CLOSE fills may be partial; the rest stays CLOSING.
 */
Size size_after_fill(const Position& current, IntentAction action, Size filled_quantity);

// Entry price after adding filled_quantity at fill_price
Price blended_entry_price(const Position& current, Size filled_quantity, Price fill_price);

} // namespace lifecycle
} // namespace gate
