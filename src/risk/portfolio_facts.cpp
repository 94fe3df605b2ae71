#include "risk/portfolio_facts.hpp"
#include <cmath>
#include <limits>

namespace gate {

Notional PortfolioFacts::symbol_signed(const std::string& symbol) const {
    auto it = symbol_signed_notional.find(symbol);
    return it != symbol_signed_notional.end() ? it->second : 0.0;
}

Notional PortfolioFacts::group_net(const std::string& group) const {
    auto it = group_net_notional.find(group);
    return it != group_net_notional.end() ? it->second : 0.0;
}

PortfolioFacts compute_portfolio_facts(
    const std::map<std::string, Position>& positions,
    const std::map<std::string, Price>& marks,
    const AccountSnapshot& account,
    const RiskEnvelope& envelope)
{
    PortfolioFacts facts;
    facts.equity = account.equity;

    for (const auto& [symbol, position] : positions) {
        if (!position.holds_size()) continue;

        Price mark = position.entry_price;
        auto it = marks.find(symbol);
        if (it != marks.end() && std::isfinite(it->second) && it->second > 0) {
            mark = it->second;
        }

        Notional signed_notional = position.signed_notional(mark);
        facts.symbol_signed_notional[symbol] = signed_notional;
        facts.total_notional += std::abs(signed_notional);
    }

    for (const auto& [group, members] : envelope.correlation_groups) {
        Notional net = 0.0;
        for (const auto& member : members) {
            net += facts.symbol_signed(member);
        }
        facts.group_net_notional[group] = net;

        double ratio = facts.equity > 0 ? std::abs(net) / facts.equity
                                        : (std::abs(net) > kEpsilon ? std::numeric_limits<double>::infinity() : 0.0);
        if (!facts.hard_ceiling_breached && ratio > envelope.correlated_hard_ceiling + kEpsilon) {
            facts.hard_ceiling_breached = true;
            facts.breached_group = group;
        }
    }

    return facts;
}

} // namespace gate
