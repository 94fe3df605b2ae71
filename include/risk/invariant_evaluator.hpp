#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "mandate/mandate.hpp"
#include "observation/observation.hpp"
#include "position/position.hpp"
#include "risk/portfolio_facts.hpp"

namespace gate {

/**
 * Everything the pure core sees for one symbol in one cycle.
 */
struct EvaluationInput {
    Position position;
    AccountSnapshot account;
    MarketSnapshot market;
    PortfolioFacts portfolio;
    bool integrity_ok{true};
};

/**
 * Derived risk facts. Leverage is always computed, never taken as input.
 */
struct RiskMetrics {
    Price mark{0.0};
    Notional notional{0.0};
    Notional total_notional{0.0};
    Notional equity{0.0};
    double effective_leverage{0.0};     // total_notional / equity
    double account_exposure{0.0};
    double symbol_exposure{0.0};
    double correlated_exposure{0.0};    // Worst group containing the symbol
    std::string correlated_group;
    Price liquidation_price{0.0};
    double liquidation_distance{1.0};
};

/**
 * Proposal-independent verdict on the current position: ALLOW, or the
 * FORCE action the engine must inject this cycle.
 */
struct Assessment {
    VerdictKind kind{VerdictKind::ALLOW};
    std::string reason;
    Size quantity{0.0};     // FORCE_REDUCE: minimum restoring quantity, FORCE_EXIT: full size
    RiskMetrics metrics;

    bool is_forced() const {
        return kind == VerdictKind::FORCE_REDUCE || kind == VerdictKind::FORCE_EXIT;
    }
};

struct InvariantVerdict {
    VerdictKind kind{VerdictKind::ALLOW};
    std::string reason;
    Size forced_quantity{0.0};

    bool allowed() const { return kind == VerdictKind::ALLOW; }
};

/**
 * Per-cap limits on how much a position may grow, in quantity units at the
 * current mark. Infinity where a cap does not bind; negative where the cap is
 * already breached in the growing direction.
 */
struct SizingHeadroom {
    Size risk_based{0.0};
    Size leverage{0.0};
    Size account_exposure{0.0};
    Size symbol_exposure{0.0};
    Size correlated{0.0};
    Size liquidation{0.0};

    Size caps() const;
    Size overall() const;
    std::string binding() const;
};

/**
 * Pure risk/leverage/liquidation/exposure checks.
 *
 * Liquidation price is the venue-reported one when the snapshot carries it,
 * otherwise the cross-margin model
 *   LONG  entry * (1 - 1/L + mmr)
 *   SHORT entry * (1 + 1/L - mmr)
 * with L the effective account leverage. Projections always use the model.
 */
class InvariantEvaluator {
public:
    explicit InvariantEvaluator(const RiskEnvelope& envelope);

    const RiskEnvelope& envelope() const { return envelope_; }

    RiskMetrics compute_metrics(const EvaluationInput& input) const;

    // Metrics after the symbol's size changes by delta (negative reduces).
    // Added size is blended into the entry at fill_price.
    RiskMetrics project(const EvaluationInput& input,
                        Direction direction,
                        Size delta,
                        Price fill_price) const;

    Assessment assess(const EvaluationInput& input) const;

    InvariantVerdict evaluate(const EvaluationInput& input, const Mandate& proposed) const;
    InvariantVerdict evaluate(const EvaluationInput& input,
                              const Mandate& proposed,
                              const Assessment& assessment) const;

    /**
     * Smallest reduction that restores every violated cap.
     *
     * Each cap has a closed-form minimum that is monotone in the reduced
     * quantity; the result is their maximum, rounded up to quantity_step.
     * 0 when nothing is violated. May be >= size, meaning only EXIT restores.
     */
    Size minimum_restoring_reduction(const EvaluationInput& input) const;

    SizingHeadroom headroom(const EvaluationInput& input,
                            Direction direction,
                            Price reference_price,
                            Price stop_price) const;

    // Free margin covers min_free_margin_pct of equity
    bool free_margin_ok(const AccountSnapshot& account) const;

    // Requested REDUCE size before rounding: quantity, else fraction of size
    Size reduction_quantity(const Position& position, const Mandate& mandate) const;

    std::vector<std::string> violations(const RiskMetrics& metrics, bool holds_size) const;

    Price model_liquidation_price(Direction direction, Price entry, double leverage) const;
    static double liquidation_distance(Direction direction, Price mark, Price liquidation_price);

    Size round_down(Size quantity) const;
    Size round_up(Size quantity) const;

private:
    RiskEnvelope envelope_;

    struct Requirement {
        Size quantity{0.0};
        std::vector<std::string> violated;
    };

    RiskMetrics metrics_for(const EvaluationInput& input,
                            Direction direction,
                            Size size,
                            Price entry,
                            Price reported_liquidation) const;

    Requirement restoring_requirement(const EvaluationInput& input, const RiskMetrics& metrics) const;

    // Highest effective leverage at which the model keeps the buffer, or
    // infinity when the buffer does not bind
    double leverage_for_buffer(Direction direction, Price mark, Price entry, double buffer) const;

    InvariantVerdict evaluate_increase(const EvaluationInput& input, const Mandate& proposed) const;
    InvariantVerdict evaluate_reduce(const EvaluationInput& input, const Mandate& proposed) const;
};

// Price the entry is expected at: limit, else entry trigger, else mark
Price entry_reference(const Mandate& mandate, Price mark);

} // namespace gate
