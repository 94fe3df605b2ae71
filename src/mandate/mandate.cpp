#include "mandate/mandate.hpp"
#include <cmath>
#include <fmt/format.h>

namespace gate {

namespace {

bool valid_price(const std::optional<Price>& p) {
    return !p || (std::isfinite(*p) && *p > 0);
}

std::string synthetic_id(const char* prefix, MandateType type, const std::string& symbol, uint64_t cycle) {
    return fmt::format("{}:{}:{}:{}", prefix, mandate_type_to_string(type), symbol, cycle);
}

MandateCheck malformed(const std::string& detail) {
    MandateCheck check;
    check.valid = false;
    check.reason = DiscardReason::MALFORMED;
    check.detail = detail;
    return check;
}

} // namespace

MandateCheck validate_mandate(const Mandate& m, const std::string& symbol, uint64_t cycle) {
    if (m.symbol != symbol) {
        return malformed(fmt::format("symbol {} does not match {}", m.symbol, symbol));
    }

    if (m.trigger_id.empty()) {
        return malformed("missing trigger_id");
    }

    if (m.authority_rank != authority_of(m.type)) {
        return malformed(fmt::format("authority {} does not match {} ({})",
                                     m.authority_rank, mandate_type_to_string(m.type),
                                     authority_of(m.type)));
    }

    if ((m.type == MandateType::ENTER || m.type == MandateType::ADD) &&
        m.direction == Direction::NONE) {
        return malformed(mandate_type_to_string(m.type) + " without direction");
    }

    const auto& scope = m.scope;
    if (scope.reduce_fraction) {
        double f = *scope.reduce_fraction;
        if (!std::isfinite(f) || f < 0 || f > 1.0) {
            return malformed(fmt::format("reduce_fraction {} outside [0, 1]", f));
        }
    }

    if (scope.quantity && (!std::isfinite(*scope.quantity) || *scope.quantity < 0)) {
        return malformed(fmt::format("invalid quantity {}", *scope.quantity));
    }

    if (!valid_price(scope.limit_price) || !valid_price(scope.stop_price) ||
        !valid_price(scope.entry_trigger_price)) {
        return malformed("non-positive or non-finite price in scope");
    }

    if (scope.limit_price && scope.entry_trigger_price) {
        return malformed("both limit_price and entry_trigger_price set");
    }

    if (m.expiry_cycle && *m.expiry_cycle < cycle) {
        MandateCheck check;
        check.valid = false;
        check.reason = DiscardReason::EXPIRED;
        check.detail = fmt::format("expired at cycle {}", *m.expiry_cycle);
        return check;
    }

    return MandateCheck{};
}

Mandate make_mandate(MandateType type,
                     const std::string& symbol,
                     Direction direction,
                     const std::string& trigger_id) {
    Mandate m;
    m.type = type;
    m.symbol = symbol;
    m.direction = direction;
    m.authority_rank = authority_of(type);
    m.trigger_id = trigger_id;
    m.origin = MandateOrigin::STRATEGY;
    return m;
}

Mandate make_forced(MandateType type,
                    const std::string& symbol,
                    Direction direction,
                    uint64_t cycle,
                    std::optional<Size> quantity) {
    Mandate m = make_mandate(type, symbol, direction, synthetic_id("force", type, symbol, cycle));
    m.origin = MandateOrigin::INVARIANT;
    m.scope.quantity = quantity;
    m.expiry_cycle = cycle;
    return m;
}

Mandate make_integrity_mandate(MandateType type, const std::string& symbol, uint64_t cycle) {
    Mandate m = make_mandate(type, symbol, Direction::NONE, synthetic_id("integrity", type, symbol, cycle));
    m.origin = MandateOrigin::INTEGRITY;
    m.expiry_cycle = cycle;
    return m;
}

Mandate make_halt_exit(const std::string& symbol, Direction direction, uint64_t cycle) {
    Mandate m = make_mandate(MandateType::EXIT, symbol, direction,
                             synthetic_id("halt", MandateType::EXIT, symbol, cycle));
    m.origin = MandateOrigin::HALT;
    m.expiry_cycle = cycle;
    return m;
}

} // namespace gate
