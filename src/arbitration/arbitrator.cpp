#include "arbitration/arbitrator.hpp"
#include "position/lifecycle.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace gate {

MandateArbitrator::MandateArbitrator(const InvariantEvaluator& evaluator)
    : evaluator_(evaluator)
{
}

bool MandateArbitrator::wins_tie(const Mandate& a, const Mandate& b, const EvaluationInput& input) const {
    // Largest risk-improving reduction wins
    if (a.type == MandateType::REDUCE && b.type == MandateType::REDUCE) {
        Size qa = evaluator_.reduction_quantity(input.position, a);
        Size qb = evaluator_.reduction_quantity(input.position, b);
        if (std::abs(qa - qb) > kEpsilon) {
            return qa > qb;
        }
    }

    if (a.is_forced() != b.is_forced()) {
        return a.is_forced();
    }

    return a.trigger_id < b.trigger_id;
}

ArbitrationResult MandateArbitrator::arbitrate(const ArbitrationContext& context,
                                               const std::vector<Mandate>& mandates) const {
    const auto& input = context.input;
    const auto& pos = input.position;
    const auto& symbol = pos.symbol;

    ArbitrationResult result;
    result.symbol = symbol;
    result.cycle = context.cycle;
    result.state = pos.state;
    result.halted = context.halted;

    // 0. Structural validation
    std::vector<Mandate> live;
    for (const auto& m : mandates) {
        auto check = validate_mandate(m, symbol, context.cycle);
        if (!check.valid) {
            result.discard(m, check.reason, check.detail);
        } else if (m.is_forced()) {
            // Forced mandates are only ever injected below
            result.discard(m, DiscardReason::MALFORMED,
                           "proposal claims origin " + mandate_origin_to_string(m.origin));
        } else {
            live.push_back(m);
        }
    }

    // 1. Halt supremacy: only EXIT survives
    if (context.halted) {
        std::vector<Mandate> kept;
        for (const auto& m : live) {
            if (m.type == MandateType::EXIT) {
                kept.push_back(m);
            } else {
                result.discard(m, DiscardReason::HALTED, "engine halted");
            }
        }

        if ((pos.holds_size() || pos.state == PositionState::ENTERING) &&
            lifecycle::is_admissible(pos.state, MandateType::EXIT)) {
            Mandate exit = make_halt_exit(symbol, pos.direction, context.cycle);
            result.forced.push_back(exit);
            kept.push_back(exit);
        }
        live = std::move(kept);
    }

    // 2. Lifecycle admissibility, narrowed by the mandate's own preconditions
    std::vector<Mandate> admissible;
    for (const auto& m : live) {
        if (!lifecycle::is_admissible(pos.state, m.type)) {
            result.discard(m, DiscardReason::STATE_INADMISSIBLE,
                           fmt::format("{} not admissible in {}",
                                       mandate_type_to_string(m.type),
                                       position_state_to_string(pos.state)));
            continue;
        }
        if (!m.preconditions.empty() &&
            std::find(m.preconditions.begin(), m.preconditions.end(), pos.state) == m.preconditions.end()) {
            result.discard(m, DiscardReason::STATE_INADMISSIBLE,
                           fmt::format("preconditions exclude {}", position_state_to_string(pos.state)));
            continue;
        }
        admissible.push_back(m);
    }

    // 3. Directional ambiguity among proposals, before any verdict
    bool enter_long = false;
    bool enter_short = false;
    for (const auto& m : admissible) {
        if (m.type != MandateType::ENTER) continue;
        if (m.direction == Direction::LONG) enter_long = true;
        if (m.direction == Direction::SHORT) enter_short = true;
    }
    if (enter_long && enter_short) {
        std::vector<Mandate> kept;
        for (const auto& m : admissible) {
            if (m.type == MandateType::ENTER) {
                result.discard(m, DiscardReason::DIRECTIONAL_AMBIGUITY, "opposing ENTER directions");
            } else {
                kept.push_back(m);
            }
        }
        admissible = std::move(kept);
    }

    // 4. Invariant filter
    Assessment assessment = evaluator_.assess(input);
    result.assessment = assessment.kind;
    result.assessment_reason = assessment.reason;

    std::vector<Mandate> survivors;
    for (const auto& m : admissible) {
        if (m.is_forced()) {
            survivors.push_back(m);
            continue;
        }
        auto verdict = evaluator_.evaluate(input, m, assessment);
        if (verdict.allowed()) {
            survivors.push_back(m);
        } else {
            result.discard(m, DiscardReason::INVARIANT_DENIED, verdict.reason);
        }
    }

    // A forced REDUCE is sized from the mark, so it waits for clean data; a forced EXIT does not
    if (!context.halted && assessment.is_forced()) {
        MandateType type = assessment.kind == VerdictKind::FORCE_EXIT ? MandateType::EXIT : MandateType::REDUCE;
        bool sizable = type == MandateType::EXIT || input.integrity_ok;
        if (sizable && lifecycle::is_admissible(pos.state, type)) {
            std::optional<Size> quantity;
            if (type == MandateType::REDUCE) quantity = assessment.quantity;
            Mandate forced = make_forced(type, symbol, pos.direction, context.cycle, quantity);
            result.forced.push_back(forced);
            survivors.push_back(forced);
        }
    }

    if (!context.halted && !input.integrity_ok) {
        std::optional<MandateType> safe;
        if (pos.state == PositionState::OPEN) safe = MandateType::BLOCK;
        if (pos.state == PositionState::FLAT) safe = MandateType::HOLD;
        if (safe) {
            Mandate injected = make_integrity_mandate(*safe, symbol, context.cycle);
            result.forced.push_back(injected);
            survivors.push_back(injected);
        }
    }

    if (survivors.empty()) {
        return result;
    }

    // 5. Authority ranking and same-tier tie-break
    int top = 0;
    for (const auto& m : survivors) {
        top = std::max(top, authority_of(m.type));
    }

    size_t best = survivors.size();
    for (size_t i = 0; i < survivors.size(); ++i) {
        if (authority_of(survivors[i].type) != top) continue;
        if (best == survivors.size() || wins_tie(survivors[i], survivors[best], input)) {
            best = i;
        }
    }

    // 6. Everything else is discarded
    const Mandate& winner = survivors[best];
    for (size_t i = 0; i < survivors.size(); ++i) {
        if (i == best) continue;
        const auto& m = survivors[i];
        if (authority_of(m.type) < top) {
            result.discard(m, DiscardReason::LOWER_AUTHORITY,
                           fmt::format("{} outranks {}", mandate_type_to_string(winner.type),
                                       mandate_type_to_string(m.type)));
        } else {
            result.discard(m, DiscardReason::SUPERSEDED,
                           fmt::format("tie lost to {}", winner.trigger_id));
        }
    }

    result.selected = winner;
    return result;
}

std::map<std::string, ArbitrationResult> MandateArbitrator::arbitrate_all(
    const std::map<std::string, ArbitrationContext>& contexts,
    const std::vector<Mandate>& mandates) const
{
    std::map<std::string, std::vector<Mandate>> by_symbol;
    for (const auto& m : mandates) {
        by_symbol[m.symbol].push_back(m);
    }

    std::map<std::string, ArbitrationResult> results;
    static const std::vector<Mandate> none;
    for (const auto& [symbol, context] : contexts) {
        auto it = by_symbol.find(symbol);
        results.emplace(symbol, arbitrate(context, it != by_symbol.end() ? it->second : none));
    }
    return results;
}

} // namespace gate
