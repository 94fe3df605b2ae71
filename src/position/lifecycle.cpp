#include "position/lifecycle.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <fmt/format.h>

namespace gate {
namespace lifecycle {

bool is_legal_transition(PositionState from, PositionState to) {
    if (to == PositionState::FAILED) {
        return from != PositionState::CLOSED && from != PositionState::FAILED;
    }

    switch (from) {
        case PositionState::FLAT:
            return to == PositionState::ENTERING;
        case PositionState::ENTERING:
            return to == PositionState::OPEN || to == PositionState::CLOSING;
        case PositionState::OPEN:
            return to == PositionState::REDUCING || to == PositionState::CLOSING;
        case PositionState::REDUCING:
            return to == PositionState::OPEN || to == PositionState::CLOSING;
        case PositionState::CLOSING:
            return to == PositionState::CLOSED;
        case PositionState::CLOSED:
            return to == PositionState::FLAT;
        case PositionState::FAILED:
            return to == PositionState::CLOSING;
    }
    return false;
}

bool is_admissible(PositionState state, MandateType type) {
    switch (state) {
        case PositionState::FLAT:
            return type == MandateType::ENTER || type == MandateType::HOLD;
        case PositionState::ENTERING:
            return type == MandateType::EXIT;
        case PositionState::OPEN:
            return type == MandateType::ADD || type == MandateType::REDUCE ||
                   type == MandateType::EXIT || type == MandateType::HOLD ||
                   type == MandateType::BLOCK;
        case PositionState::REDUCING:
            return type == MandateType::REDUCE || type == MandateType::EXIT;
        case PositionState::CLOSING:
        case PositionState::CLOSED:
            return false;
        case PositionState::FAILED:
            return type == MandateType::EXIT;
    }
    return false;
}

std::vector<MandateType> admissible_mandates(PositionState state) {
    static const MandateType all[] = {
        MandateType::ENTER, MandateType::ADD, MandateType::REDUCE,
        MandateType::EXIT, MandateType::BLOCK, MandateType::HOLD
    };

    std::vector<MandateType> result;
    for (MandateType t : all) {
        if (is_admissible(state, t)) {
            result.push_back(t);
        }
    }
    return result;
}

bool requires_initiating_mandate(PositionState from, PositionState to) {
    if (to == PositionState::ENTERING || to == PositionState::REDUCING) {
        return true;
    }
    // Completion of a reduce that emptied the position goes REDUCING -> CLOSING
    // without a new mandate
    return to == PositionState::CLOSING && from != PositionState::REDUCING;
}

std::optional<PositionState> target_state(PositionState from, IntentAction action) {
    switch (action) {
        case IntentAction::OPEN:
            if (from == PositionState::FLAT) return PositionState::ENTERING;
            if (from == PositionState::OPEN) return PositionState::OPEN;
            return std::nullopt;
        case IntentAction::REDUCE:
            if (from == PositionState::OPEN || from == PositionState::REDUCING) return PositionState::REDUCING;
            return std::nullopt;
        case IntentAction::CLOSE:
            if (from == PositionState::ENTERING || from == PositionState::OPEN ||
                from == PositionState::REDUCING || from == PositionState::FAILED) {
                return PositionState::CLOSING;
            }
            return std::nullopt;
    }
    return std::nullopt;
}

MandateType initiating_mandate(PositionState from, IntentAction action) {
    switch (action) {
        case IntentAction::OPEN:
            return from == PositionState::FLAT ? MandateType::ENTER : MandateType::ADD;
        case IntentAction::REDUCE:
            return MandateType::REDUCE;
        case IntentAction::CLOSE:
            return MandateType::EXIT;
    }
    return MandateType::HOLD;
}

Position transition(const Position& current, PositionState to, std::optional<MandateType> initiating) {
    if (!is_legal_transition(current.state, to)) {
        throw IllegalTransition(fmt::format("{}: {} -> {} is not a legal transition",
                                            current.symbol,
                                            position_state_to_string(current.state),
                                            position_state_to_string(to)));
    }

    if (requires_initiating_mandate(current.state, to)) {
        if (!initiating) {
            throw IllegalTransition(fmt::format("{}: {} -> {} requires an initiating mandate",
                                                current.symbol,
                                                position_state_to_string(current.state),
                                                position_state_to_string(to)));
        }
        if (!is_admissible(current.state, *initiating)) {
            throw IllegalTransition(fmt::format("{}: {} is not admissible in {}",
                                                current.symbol,
                                                mandate_type_to_string(*initiating),
                                                position_state_to_string(current.state)));
        }
    }

    if (current.state != PositionState::FLAT && current.state != PositionState::CLOSED &&
        current.direction == Direction::NONE && current.holds_size()) {
        throw IllegalTransition(fmt::format("{}: non-flat position without direction", current.symbol));
    }

    Position next = current;
    next.state = to;

    if (to == PositionState::FLAT) {
        next = Position::flat(current.symbol);
        next.last_update_cycle = current.last_update_cycle;
    }

    return next;
}

Size size_after_fill(const Position& current, IntentAction action, Size filled_quantity) {
    if (!std::isfinite(filled_quantity) || filled_quantity < 0) {
        throw IllegalTransition(fmt::format("{}: invalid fill quantity {}", current.symbol, filled_quantity));
    }

    switch (action) {
        case IntentAction::OPEN:
            return current.size + filled_quantity;
        case IntentAction::REDUCE:
        case IntentAction::CLOSE: {
            if (action == IntentAction::REDUCE && filled_quantity <= kEpsilon) {
                throw IllegalTransition(fmt::format("{}: REDUCE fill must decrease size", current.symbol));
            }
            if (filled_quantity > current.size + kEpsilon) {
                throw IllegalTransition(fmt::format("{}: {} fill {:.8f} exceeds size {:.8f}",
                                                    current.symbol, intent_action_to_string(action),
                                                    filled_quantity, current.size));
            }
            double remaining = current.size - filled_quantity;
            return remaining > kEpsilon ? remaining : 0.0;
        }
    }
    return current.size;
}

Price blended_entry_price(const Position& current, Size filled_quantity, Price fill_price) {
    double new_size = current.size + filled_quantity;
    if (new_size <= kEpsilon) {
        return current.entry_price;
    }
    return (current.size * current.entry_price + filled_quantity * fill_price) / new_size;
}

} // namespace lifecycle
} // namespace gate
