#pragma once

#include <map>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "position/position.hpp"

namespace gate {

/**
 * Cross-symbol facts computed once at cycle start.
 *
 * Symbol workers read these and never query each other, so correlation
 * and global exposure caps need no synchronisation.
 */
struct PortfolioFacts {
    Notional equity{0.0};
    Notional total_notional{0.0};                           // Sum of |notional|
    std::map<std::string, Notional> symbol_signed_notional;
    std::map<std::string, Notional> group_net_notional;     // Signed, per correlation group
    bool hard_ceiling_breached{false};
    std::string breached_group;

    Notional symbol_signed(const std::string& symbol) const;
    Notional group_net(const std::string& group) const;
};

/**
 * Marks come from the cycle's snapshots. A position without a snapshot is
 * valued at its entry price.
 */
PortfolioFacts compute_portfolio_facts(
    const std::map<std::string, Position>& positions,
    const std::map<std::string, Price>& marks,
    const AccountSnapshot& account,
    const RiskEnvelope& envelope
);

} // namespace gate
