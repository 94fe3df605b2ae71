#pragma once

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include "arbitration/arbitration_result.hpp"
#include "mandate/mandate.hpp"
#include "risk/invariant_evaluator.hpp"

namespace gate {

struct ArbitrationContext {
    uint64_t cycle{0};
    bool halted{false};
    EvaluationInput input;
};

/**
 * Deterministic selection of at most one mandate per symbol per cycle.
 *
 *   0. structural validation            MALFORMED, EXPIRED
 *   1. halt filter                      HALTED, best-effort EXIT injected
 *   2. lifecycle admissibility          STATE_INADMISSIBLE
 *   3. opposing ENTER directions        DIRECTIONAL_AMBIGUITY
 *   4. invariant filter                 INVARIANT_DENIED, FORCE injected
 *   5. authority ranking, tie-break     SUPERSEDED
 *   6. lower tiers                      LOWER_AUTHORITY
 *
 * No I/O, no mutation, no clock, no randomness, no reads of other symbols.
 */
class MandateArbitrator {
public:
    explicit MandateArbitrator(const InvariantEvaluator& evaluator);

    ArbitrationResult arbitrate(const ArbitrationContext& context,
                                const std::vector<Mandate>& mandates) const;

    // Mandates are partitioned by symbol; a symbol without a context is ignored
    std::map<std::string, ArbitrationResult> arbitrate_all(
        const std::map<std::string, ArbitrationContext>& contexts,
        const std::vector<Mandate>& mandates) const;

private:
    const InvariantEvaluator& evaluator_;

    // Strict weak order within one authority tier; true if a beats b
    bool wins_tie(const Mandate& a, const Mandate& b, const EvaluationInput& input) const;
};

} // namespace gate
