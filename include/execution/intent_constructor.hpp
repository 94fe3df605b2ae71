#pragma once

#include <optional>
#include "execution/execution_intent.hpp"
#include "mandate/mandate.hpp"
#include "risk/invariant_evaluator.hpp"

namespace gate {

/**
 * Turns the selected mandate into an execution intent.
 *
 * Sizing only ever shrinks a request. When no positive size satisfies every
 * cap the intent is suppressed rather than resized by relaxing a cap.
 */
class IntentConstructor {
public:
    explicit IntentConstructor(const InvariantEvaluator& evaluator);

    std::optional<ExecutionIntent> construct(const Mandate& selected, const EvaluationInput& input) const;

    // min(risk based, leverage cap, liquidation safe), capped by the request,
    // rounded down to the quantity step. 0 when nothing fits.
    Size increase_size(const Mandate& mandate, const EvaluationInput& input, Price stop_price) const;

private:
    const InvariantEvaluator& evaluator_;

    std::optional<ExecutionIntent> construct_increase(const Mandate& m, const EvaluationInput& input) const;
    std::optional<ExecutionIntent> construct_reduce(const Mandate& m, const EvaluationInput& input) const;
    std::optional<ExecutionIntent> construct_exit(const Mandate& m, const EvaluationInput& input) const;
};

} // namespace gate
