#include "observation/observation.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <fmt/format.h>

namespace gate {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

ObservationGate::ObservationGate(const IntegrityConfig& config)
    : config_(config)
{
    for (auto& term : config_.forbidden_terms) {
        term = to_lower(term);
    }
}

bool ObservationGate::is_interpretive(const std::string& primitive_name) const {
    std::istringstream ss(to_lower(primitive_name));
    std::string token;
    while (std::getline(ss, token, '_')) {
        if (token.empty()) continue;
        if (std::find(config_.forbidden_terms.begin(), config_.forbidden_terms.end(), token) !=
            config_.forbidden_terms.end()) {
            return true;
        }
    }
    return false;
}

IntegrityReport ObservationGate::check(const MarketSnapshot& snapshot) const {
    IntegrityReport report;

    if (snapshot.symbol.empty()) {
        report.issues.push_back("snapshot without symbol");
    }

    if (!std::isfinite(snapshot.mark_price) || snapshot.mark_price <= 0) {
        report.issues.push_back(fmt::format("invalid mark price {}", snapshot.mark_price));
    }

    if (!std::isfinite(snapshot.liquidation_price) || snapshot.liquidation_price < 0) {
        report.issues.push_back(fmt::format("invalid liquidation price {}", snapshot.liquidation_price));
    }

    if (snapshot.age_ms < 0 || snapshot.age_ms > config_.max_snapshot_age_ms) {
        report.issues.push_back(fmt::format("stale snapshot: age {}ms exceeds {}ms",
                                            snapshot.age_ms, config_.max_snapshot_age_ms));
    }

    for (const auto& name : config_.required_primitives) {
        auto it = snapshot.primitives.find(name);
        if (it == snapshot.primitives.end()) {
            report.issues.push_back("missing primitive " + name);
        } else if (!std::isfinite(it->second)) {
            report.issues.push_back("non-finite primitive " + name);
        }
    }

    for (const auto& [name, value] : snapshot.primitives) {
        if (is_interpretive(name)) {
            report.issues.push_back("interpreted label in primitive " + name);
        }
    }

    report.ok = report.issues.empty();
    return report;
}

} // namespace gate
