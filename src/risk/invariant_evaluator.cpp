#include "risk/invariant_evaluator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace gate {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

double ratio(double notional, double equity) {
    if (equity > 0) return notional / equity;
    return notional > kEpsilon ? kInfinity : 0.0;
}

Price valid_mark(const EvaluationInput& input) {
    Price mark = input.market.mark_price;
    if (std::isfinite(mark) && mark > 0) return mark;
    return input.position.entry_price;
}

InvariantVerdict deny(const std::string& reason) {
    InvariantVerdict v;
    v.kind = VerdictKind::DENY;
    v.reason = reason;
    return v;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += "; ";
        out += p;
    }
    return out;
}

} // namespace

Size SizingHeadroom::caps() const {
    return std::min({leverage, account_exposure, symbol_exposure, correlated, liquidation});
}

Size SizingHeadroom::overall() const {
    return std::min(risk_based, caps());
}

std::string SizingHeadroom::binding() const {
    Size v = overall();
    if (v == risk_based) return "risk_per_trade";
    if (v == leverage) return "effective_leverage";
    if (v == account_exposure) return "account_exposure";
    if (v == symbol_exposure) return "symbol_exposure";
    if (v == correlated) return "correlated_exposure";
    return "liquidation_buffer";
}

Price entry_reference(const Mandate& mandate, Price mark) {
    if (mandate.scope.limit_price) return *mandate.scope.limit_price;
    if (mandate.scope.entry_trigger_price) return *mandate.scope.entry_trigger_price;
    return mark;
}

InvariantEvaluator::InvariantEvaluator(const RiskEnvelope& envelope)
    : envelope_(envelope)
{
}

Price InvariantEvaluator::model_liquidation_price(Direction direction, Price entry, double leverage) const {
    if (leverage <= 0 || !std::isfinite(leverage)) {
        return direction == Direction::SHORT ? kInfinity : entry;
    }
    double mmr = envelope_.maintenance_margin_rate;
    if (direction == Direction::LONG) {
        return std::max(0.0, entry * (1.0 - 1.0 / leverage + mmr));
    }
    if (direction == Direction::SHORT) {
        return entry * (1.0 + 1.0 / leverage - mmr);
    }
    return 0.0;
}

double InvariantEvaluator::liquidation_distance(Direction direction, Price mark, Price liquidation_price) {
    if (!(mark > 0)) return 0.0;

    switch (direction) {
        case Direction::LONG:
            if (liquidation_price <= 0) return 1.0;
            if (liquidation_price >= mark) return 0.0;
            return (mark - liquidation_price) / mark;
        case Direction::SHORT:
            if (liquidation_price <= mark) return 0.0;
            if (!std::isfinite(liquidation_price)) return 1.0;
            return (liquidation_price - mark) / mark;
        case Direction::NONE:
            return 1.0;
    }
    return 1.0;
}

double InvariantEvaluator::leverage_for_buffer(Direction direction, Price mark, Price entry, double buffer) const {
    if (!(entry > 0)) return kInfinity;

    double mmr = envelope_.maintenance_margin_rate;
    double den = 0.0;
    if (direction == Direction::LONG) {
        den = 1.0 + mmr - mark * (1.0 - buffer) / entry;
    } else if (direction == Direction::SHORT) {
        den = mark * (1.0 + buffer) / entry - 1.0 + mmr;
    }

    if (den <= kEpsilon) return kInfinity;
    return 1.0 / den;
}

Size InvariantEvaluator::round_down(Size quantity) const {
    if (quantity <= 0) return 0.0;
    double step = envelope_.quantity_step;
    if (step <= 0) return quantity;
    return std::floor(quantity / step + 1e-9) * step;
}

Size InvariantEvaluator::round_up(Size quantity) const {
    if (quantity <= 0) return 0.0;
    double step = envelope_.quantity_step;
    if (step <= 0) return quantity;
    return std::ceil(quantity / step - 1e-9) * step;
}

RiskMetrics InvariantEvaluator::metrics_for(const EvaluationInput& input,
                                            Direction direction,
                                            Size size,
                                            Price entry,
                                            Price reported_liquidation) const {
    const auto& symbol = input.position.symbol;
    const auto& portfolio = input.portfolio;

    RiskMetrics m;
    m.mark = valid_mark(input);
    m.equity = input.account.equity;

    Notional own_before = portfolio.symbol_signed(symbol);
    Notional own_after = direction_sign(direction) * size * m.mark;

    m.notional = std::abs(own_after);
    m.total_notional = std::max(0.0, portfolio.total_notional - std::abs(own_before)) + m.notional;
    m.effective_leverage = ratio(m.total_notional, m.equity);
    m.account_exposure = m.effective_leverage;
    m.symbol_exposure = ratio(m.notional, m.equity);

    for (const auto& group : envelope_.groups_for(symbol)) {
        Notional net = portfolio.group_net(group) - own_before + own_after;
        double r = ratio(std::abs(net), m.equity);
        if (r > m.correlated_exposure || m.correlated_group.empty()) {
            m.correlated_exposure = r;
            m.correlated_group = group;
        }
    }

    if (size <= kEpsilon || direction == Direction::NONE) {
        m.liquidation_price = 0.0;
        m.liquidation_distance = 1.0;
        return m;
    }

    if (reported_liquidation > 0) {
        m.liquidation_price = reported_liquidation;
    } else if (!std::isfinite(m.effective_leverage)) {
        m.liquidation_price = m.mark;
    } else {
        m.liquidation_price = model_liquidation_price(direction, entry, m.effective_leverage);
    }
    m.liquidation_distance = liquidation_distance(direction, m.mark, m.liquidation_price);

    return m;
}

RiskMetrics InvariantEvaluator::compute_metrics(const EvaluationInput& input) const {
    const auto& pos = input.position;
    return metrics_for(input, pos.direction, pos.holds_size() ? pos.size : 0.0,
                       pos.entry_price, input.market.liquidation_price);
}

RiskMetrics InvariantEvaluator::project(const EvaluationInput& input,
                                        Direction direction,
                                        Size delta,
                                        Price fill_price) const {
    const auto& pos = input.position;
    Size current = pos.holds_size() ? pos.size : 0.0;
    Size next = std::max(0.0, current + delta);

    Price entry = pos.entry_price;
    if (delta > 0) {
        entry = current > 0 ? (current * pos.entry_price + delta * fill_price) / next : fill_price;
    }

    return metrics_for(input, direction, next, entry, 0.0);
}

std::vector<std::string> InvariantEvaluator::violations(const RiskMetrics& m, bool holds_size) const {
    std::vector<std::string> out;
    const auto& env = envelope_;

    if (m.effective_leverage > env.max_effective_leverage + kEpsilon) {
        out.push_back(fmt::format("effective leverage {:.4f} exceeds {:.4f}",
                                  m.effective_leverage, env.max_effective_leverage));
    }
    if (m.account_exposure > env.max_account_exposure + kEpsilon) {
        out.push_back(fmt::format("account exposure {:.4f} exceeds {:.4f}",
                                  m.account_exposure, env.max_account_exposure));
    }
    if (m.symbol_exposure > env.max_symbol_exposure + kEpsilon) {
        out.push_back(fmt::format("symbol exposure {:.4f} exceeds {:.4f}",
                                  m.symbol_exposure, env.max_symbol_exposure));
    }
    if (m.correlated_exposure > env.max_correlated_exposure + kEpsilon) {
        out.push_back(fmt::format("correlated exposure {:.4f} in {} exceeds {:.4f}",
                                  m.correlated_exposure, m.correlated_group, env.max_correlated_exposure));
    }
    if (holds_size && m.liquidation_distance < env.min_liquidation_buffer - kEpsilon) {
        out.push_back(fmt::format("liquidation distance {:.4f} below {:.4f}",
                                  m.liquidation_distance, env.min_liquidation_buffer));
    }
    return out;
}

InvariantEvaluator::Requirement InvariantEvaluator::restoring_requirement(
    const EvaluationInput& input, const RiskMetrics& m) const
{
    Requirement req;
    const auto& pos = input.position;
    const auto& env = envelope_;

    if (!pos.holds_size()) return req;

    Size size = pos.size;
    if (m.equity <= 0) {
        req.quantity = size;
        req.violated.push_back(fmt::format("non-positive equity {:.2f}", m.equity));
        return req;
    }

    Price p = m.mark;
    Notional equity = m.equity;
    Notional total = m.total_notional;

    auto require = [&req](Size dq, std::string what) {
        req.quantity = std::max(req.quantity, dq);
        req.violated.push_back(std::move(what));
    };

    if (m.effective_leverage > env.max_effective_leverage + kEpsilon) {
        require((total - env.max_effective_leverage * equity) / p,
                fmt::format("effective leverage {:.4f} exceeds {:.4f}",
                            m.effective_leverage, env.max_effective_leverage));
    }

    if (m.account_exposure > env.max_account_exposure + kEpsilon) {
        require((total - env.max_account_exposure * equity) / p,
                fmt::format("account exposure {:.4f} exceeds {:.4f}",
                            m.account_exposure, env.max_account_exposure));
    }

    if (m.symbol_exposure > env.max_symbol_exposure + kEpsilon) {
        require((m.notional - env.max_symbol_exposure * equity) / p,
                fmt::format("symbol exposure {:.4f} exceeds {:.4f}",
                            m.symbol_exposure, env.max_symbol_exposure));
    }

    // Only groups this position pushes further out; a hedge is left alone
    double sign = direction_sign(pos.direction);
    Notional own_before = input.portfolio.symbol_signed(pos.symbol);
    for (const auto& group : env.groups_for(pos.symbol)) {
        Notional net = input.portfolio.group_net(group) - own_before + sign * size * p;
        if (sign * net <= 0) continue;
        double r = std::abs(net) / equity;
        if (r > env.max_correlated_exposure + kEpsilon) {
            require((std::abs(net) - env.max_correlated_exposure * equity) / p,
                    fmt::format("correlated exposure {:.4f} in {} exceeds {:.4f}",
                                r, group, env.max_correlated_exposure));
        }
    }

    if (m.liquidation_distance < env.min_liquidation_buffer - kEpsilon) {
        double max_leverage = leverage_for_buffer(pos.direction, p, pos.entry_price,
                                                  env.min_liquidation_buffer);
        Size dq = std::isfinite(max_leverage) ? (total - max_leverage * equity) / p : 0.0;
        if (dq <= kEpsilon) {
            // Venue-reported price closer than the model: fixed fraction
            dq = env.default_reduce_fraction * size;
        }
        require(dq, fmt::format("liquidation distance {:.4f} below {:.4f}",
                                m.liquidation_distance, env.min_liquidation_buffer));
    }

    if (!req.violated.empty()) {
        req.quantity = round_up(req.quantity);
        if (env.min_order_quantity > 0) {
            req.quantity = std::max(req.quantity, env.min_order_quantity);
        }
    }

    return req;
}

Size InvariantEvaluator::minimum_restoring_reduction(const EvaluationInput& input) const {
    return restoring_requirement(input, compute_metrics(input)).quantity;
}

Assessment InvariantEvaluator::assess(const EvaluationInput& input) const {
    Assessment a;
    a.metrics = compute_metrics(input);

    const auto& pos = input.position;
    if (!pos.holds_size()) return a;

    if (pos.state == PositionState::FAILED) {
        a.kind = VerdictKind::FORCE_EXIT;
        a.quantity = pos.size;
        a.reason = "position FAILED with open size";
        return a;
    }

    if (pos.state != PositionState::OPEN && pos.state != PositionState::REDUCING) {
        return a;
    }

    if (a.metrics.liquidation_distance < envelope_.critical_liquidation_buffer - kEpsilon) {
        a.kind = VerdictKind::FORCE_EXIT;
        a.quantity = pos.size;
        a.reason = fmt::format("liquidation distance {:.4f} below critical {:.4f}",
                               a.metrics.liquidation_distance, envelope_.critical_liquidation_buffer);
        return a;
    }

    auto req = restoring_requirement(input, a.metrics);
    if (req.violated.empty()) return a;

    a.reason = join(req.violated);
    if (req.quantity >= pos.size - kEpsilon) {
        a.kind = VerdictKind::FORCE_EXIT;
        a.quantity = pos.size;
        a.reason += "; no partial reduction restores";
    } else {
        a.kind = VerdictKind::FORCE_REDUCE;
        a.quantity = req.quantity;
    }
    return a;
}

InvariantVerdict InvariantEvaluator::evaluate(const EvaluationInput& input, const Mandate& proposed) const {
    return evaluate(input, proposed, assess(input));
}

InvariantVerdict InvariantEvaluator::evaluate(const EvaluationInput& input,
                                              const Mandate& proposed,
                                              const Assessment& assessment) const {
    if (proposed.type == MandateType::EXIT) {
        return InvariantVerdict{};
    }

    if (assessment.is_forced()) {
        InvariantVerdict v;
        v.kind = assessment.kind;
        v.forced_quantity = assessment.quantity;
        v.reason = fmt::format("{} pending: {}", verdict_kind_to_string(assessment.kind), assessment.reason);
        return v;
    }

    switch (proposed.type) {
        case MandateType::ENTER:
        case MandateType::ADD:
            return evaluate_increase(input, proposed);
        case MandateType::REDUCE:
            return evaluate_reduce(input, proposed);
        case MandateType::BLOCK:
        case MandateType::HOLD:
        case MandateType::EXIT:
            return InvariantVerdict{};
    }
    return InvariantVerdict{};
}

InvariantVerdict InvariantEvaluator::evaluate_increase(const EvaluationInput& input, const Mandate& proposed) const {
    const auto& pos = input.position;
    const auto& env = envelope_;
    Direction dir = proposed.direction;
    Notional equity = input.account.equity;
    Price mark = input.market.mark_price;

    if (!input.integrity_ok) {
        return deny("data integrity failure");
    }
    if (equity <= 0) {
        return deny(fmt::format("non-positive equity {:.2f}", equity));
    }
    if (!free_margin_ok(input.account)) {
        return deny(fmt::format("free margin {:.2f} below floor {:.2f}",
                                input.account.margin_available, env.min_free_margin_pct * equity));
    }
    if (!std::isfinite(mark) || mark <= 0) {
        return deny("no valid mark price");
    }

    Price stop = 0.0;
    if (proposed.type == MandateType::ENTER) {
        if (pos.holds_size()) {
            return deny("ENTER on a position that holds size");
        }
        if (!proposed.scope.stop_price) {
            return deny("ENTER without protective stop");
        }
        stop = *proposed.scope.stop_price;
    } else {
        if (dir != pos.direction) {
            return deny(fmt::format("ADD direction {} does not match position {}",
                                    direction_to_string(dir), direction_to_string(pos.direction)));
        }
        if ((dir == Direction::LONG && mark < pos.entry_price - kEpsilon) ||
            (dir == Direction::SHORT && mark > pos.entry_price + kEpsilon)) {
            return deny(fmt::format("ADD at {:.6f} would average down from entry {:.6f}",
                                    mark, pos.entry_price));
        }
        stop = tighter_stop(dir, pos.stop_price, proposed.scope.stop_price.value_or(0.0));
        if (stop <= 0) {
            return deny("ADD without protective stop");
        }
    }

    Price reference = entry_reference(proposed, mark);
    if ((dir == Direction::LONG && stop >= reference - kEpsilon) ||
        (dir == Direction::SHORT && stop <= reference + kEpsilon)) {
        return deny(fmt::format("stop {:.6f} on wrong side of entry {:.6f}", stop, reference));
    }

    auto h = headroom(input, dir, reference, stop);
    if (h.leverage < -kEpsilon) return deny("effective leverage already above cap");
    if (h.account_exposure < -kEpsilon) return deny("account exposure already above cap");
    if (h.symbol_exposure < -kEpsilon) return deny("symbol exposure cap exhausted");
    if (h.correlated < -kEpsilon) return deny("correlated exposure cap exhausted");
    if (h.liquidation < -kEpsilon) return deny("liquidation buffer already below minimum");

    if (proposed.scope.quantity) {
        Size q = *proposed.scope.quantity;
        if (q <= kEpsilon) {
            return deny("requested quantity is zero");
        }

        auto after = project(input, dir, q, reference);
        if (after.effective_leverage > env.max_effective_leverage + kEpsilon) {
            return deny(fmt::format("projected leverage {:.4f} exceeds {:.4f}",
                                    after.effective_leverage, env.max_effective_leverage));
        }
        if (after.account_exposure > env.max_account_exposure + kEpsilon) {
            return deny(fmt::format("projected account exposure {:.4f} exceeds {:.4f}",
                                    after.account_exposure, env.max_account_exposure));
        }
        if (after.symbol_exposure > env.max_symbol_exposure + kEpsilon) {
            return deny(fmt::format("projected symbol exposure {:.4f} exceeds {:.4f}",
                                    after.symbol_exposure, env.max_symbol_exposure));
        }
        if (q > h.correlated + kEpsilon) {
            return deny(fmt::format("projected correlated exposure exceeds {:.4f}",
                                    env.max_correlated_exposure));
        }
        if (after.liquidation_distance < env.min_liquidation_buffer - kEpsilon) {
            return deny(fmt::format("projected liquidation distance {:.4f} below {:.4f}",
                                    after.liquidation_distance, env.min_liquidation_buffer));
        }

        Notional loss = q * std::abs(reference - stop);
        if (loss > env.max_risk_per_trade * equity + kEpsilon) {
            return deny(fmt::format("loss at stop {:.2f} exceeds risk budget {:.2f}",
                                    loss, env.max_risk_per_trade * equity));
        }
    }

    return InvariantVerdict{};
}

InvariantVerdict InvariantEvaluator::evaluate_reduce(const EvaluationInput& input, const Mandate& proposed) const {
    const auto& pos = input.position;

    if (!input.integrity_ok) {
        return deny("data integrity failure");
    }
    if (!pos.holds_size()) {
        return deny("no size to reduce");
    }

    Size q = round_down(reduction_quantity(pos, proposed));
    if (q <= kEpsilon) {
        return deny("reduction quantity is zero");
    }
    if (q >= pos.size - kEpsilon) {
        return deny(fmt::format("reduction {:.8f} would close the whole position", q));
    }

    Price mark = valid_mark(input);
    auto before = project(input, pos.direction, 0.0, mark);
    auto after = project(input, pos.direction, -q, mark);

    bool improves = after.effective_leverage < before.effective_leverage - kEpsilon ||
                    after.account_exposure < before.account_exposure - kEpsilon ||
                    after.symbol_exposure < before.symbol_exposure - kEpsilon ||
                    after.liquidation_distance > before.liquidation_distance + kEpsilon;
    if (!improves) {
        return deny("reduction improves neither leverage, liquidation distance nor exposure");
    }

    return InvariantVerdict{};
}

bool InvariantEvaluator::free_margin_ok(const AccountSnapshot& account) const {
    return account.margin_available >= envelope_.min_free_margin_pct * account.equity - kEpsilon;
}

SizingHeadroom InvariantEvaluator::headroom(const EvaluationInput& input,
                                            Direction direction,
                                            Price reference_price,
                                            Price stop_price) const {
    SizingHeadroom h;
    const auto& pos = input.position;
    const auto& env = envelope_;
    Price p = input.market.mark_price;
    Notional equity = input.account.equity;

    if (!std::isfinite(p) || p <= 0 || reference_price <= 0) {
        return h;
    }

    double sign = direction_sign(direction);
    Size own = (pos.holds_size() && pos.direction == direction) ? pos.size : 0.0;
    Notional own_before = input.portfolio.symbol_signed(pos.symbol);
    Notional total = std::max(0.0, input.portfolio.total_notional - std::abs(own_before)) + own * p;

    double stop_distance = stop_price > 0 ? std::abs(reference_price - stop_price) : 0.0;
    h.risk_based = (stop_distance > kEpsilon && equity > 0)
        ? env.max_risk_per_trade * equity / stop_distance
        : 0.0;

    h.leverage = (env.max_effective_leverage * equity - total) / p;
    h.account_exposure = (env.max_account_exposure * equity - total) / p;
    h.symbol_exposure = (env.max_symbol_exposure * equity - own * p) / p;

    h.correlated = kInfinity;
    for (const auto& group : env.groups_for(pos.symbol)) {
        Notional net = input.portfolio.group_net(group) - own_before + sign * own * p;
        h.correlated = std::min(h.correlated, (env.max_correlated_exposure * equity - sign * net) / p);
    }

    // Blended entry lies between the current entry and the reference; the
    // worse end keeps the bound conservative
    Price entry = reference_price;
    if (own > 0) {
        entry = direction == Direction::SHORT ? std::min(pos.entry_price, reference_price)
                                              : std::max(pos.entry_price, reference_price);
    }
    double max_leverage = leverage_for_buffer(direction, p, entry, env.min_liquidation_buffer);
    h.liquidation = std::isfinite(max_leverage) ? (max_leverage * equity - total) / p : kInfinity;

    return h;
}

Size InvariantEvaluator::reduction_quantity(const Position& position, const Mandate& mandate) const {
    if (mandate.scope.quantity) {
        return *mandate.scope.quantity;
    }
    double fraction = mandate.scope.reduce_fraction.value_or(envelope_.default_reduce_fraction);
    return fraction * position.size;
}

} // namespace gate
