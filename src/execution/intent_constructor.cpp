#include "execution/intent_constructor.hpp"
#include <algorithm>
#include <cmath>

namespace gate {

IntentConstructor::IntentConstructor(const InvariantEvaluator& evaluator)
    : evaluator_(evaluator)
{
}

std::optional<ExecutionIntent> IntentConstructor::construct(const Mandate& selected,
                                                            const EvaluationInput& input) const {
    switch (selected.type) {
        case MandateType::ENTER:
        case MandateType::ADD:
            return construct_increase(selected, input);
        case MandateType::REDUCE:
            return construct_reduce(selected, input);
        case MandateType::EXIT:
            return construct_exit(selected, input);
        case MandateType::BLOCK:
        case MandateType::HOLD:
            return std::nullopt;
    }
    return std::nullopt;
}

Size IntentConstructor::increase_size(const Mandate& mandate, const EvaluationInput& input, Price stop_price) const {
    if (!evaluator_.free_margin_ok(input.account)) return 0.0;

    Direction direction = mandate.type == MandateType::ENTER ? mandate.direction : input.position.direction;
    Price reference = entry_reference(mandate, input.market.mark_price);

    auto h = evaluator_.headroom(input, direction, reference, stop_price);
    Size size = h.overall();
    if (mandate.scope.quantity) {
        size = std::min(size, *mandate.scope.quantity);
    }

    if (!std::isfinite(size)) return 0.0;
    size = evaluator_.round_down(size);

    const auto& env = evaluator_.envelope();
    if (size <= kEpsilon || size < env.min_order_quantity - kEpsilon) {
        return 0.0;
    }
    return size;
}

std::optional<ExecutionIntent> IntentConstructor::construct_increase(const Mandate& m,
                                                                     const EvaluationInput& input) const {
    const auto& pos = input.position;
    Direction direction = m.type == MandateType::ENTER ? m.direction : pos.direction;
    if (direction == Direction::NONE) return std::nullopt;

    Price stop = m.scope.stop_price.value_or(0.0);
    if (m.type == MandateType::ADD) {
        stop = tighter_stop(direction, pos.stop_price, stop);
    }
    if (stop <= 0) return std::nullopt;

    Price reference = entry_reference(m, input.market.mark_price);
    if ((direction == Direction::LONG && stop >= reference) ||
        (direction == Direction::SHORT && stop <= reference)) {
        return std::nullopt;
    }

    Size quantity = increase_size(m, input, stop);
    if (quantity <= 0) return std::nullopt;

    ExecutionIntent intent;
    intent.symbol = pos.symbol;
    intent.action = IntentAction::OPEN;
    intent.direction = direction;
    intent.quantity = quantity;
    intent.stop_price = stop;
    intent.mandate_type = m.type;
    intent.trigger_id = m.trigger_id;

    if (m.scope.limit_price) {
        intent.price_type = PriceType::LIMIT;
        intent.limit_price = *m.scope.limit_price;
    } else if (m.scope.entry_trigger_price) {
        intent.price_type = PriceType::STOP;
        intent.limit_price = *m.scope.entry_trigger_price;
    } else {
        intent.price_type = PriceType::MARKET;
    }

    return intent;
}

std::optional<ExecutionIntent> IntentConstructor::construct_reduce(const Mandate& m,
                                                                   const EvaluationInput& input) const {
    const auto& pos = input.position;
    const auto& env = evaluator_.envelope();
    if (!pos.holds_size()) return std::nullopt;

    Size restoring = evaluator_.minimum_restoring_reduction(input);
    Size quantity = 0.0;

    if (m.origin == MandateOrigin::INVARIANT) {
        quantity = m.scope.quantity.value_or(restoring);
        if (env.min_order_quantity > 0) {
            quantity = std::max(quantity, env.min_order_quantity);
        }
    } else {
        quantity = evaluator_.round_down(evaluator_.reduction_quantity(pos, m));
        quantity = std::max(quantity, restoring);
        if (quantity < env.min_order_quantity - kEpsilon) return std::nullopt;
    }

    // A reduction never becomes a disguised exit
    if (quantity <= kEpsilon || quantity >= pos.size - kEpsilon) return std::nullopt;

    ExecutionIntent intent;
    intent.symbol = pos.symbol;
    intent.action = IntentAction::REDUCE;
    intent.direction = pos.direction;
    intent.quantity = quantity;
    intent.price_type = PriceType::MARKET;
    intent.stop_price = pos.stop_price;
    intent.mandate_type = MandateType::REDUCE;
    intent.trigger_id = m.trigger_id;
    return intent;
}

std::optional<ExecutionIntent> IntentConstructor::construct_exit(const Mandate& m,
                                                                 const EvaluationInput& input) const {
    const auto& pos = input.position;

    // In ENTERING the intent cancels the working entry; any partial fill is flattened
    if (!pos.holds_size() && pos.state != PositionState::ENTERING) {
        return std::nullopt;
    }

    ExecutionIntent intent;
    intent.symbol = pos.symbol;
    intent.action = IntentAction::CLOSE;
    intent.direction = pos.direction;
    intent.quantity = pos.holds_size() ? pos.size : 0.0;
    intent.price_type = PriceType::MARKET;
    intent.stop_price = pos.stop_price;
    intent.mandate_type = MandateType::EXIT;
    intent.trigger_id = m.trigger_id;
    return intent;
}

} // namespace gate
