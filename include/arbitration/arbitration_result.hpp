#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include "common/types.hpp"
#include "mandate/mandate.hpp"

namespace gate {

struct DiscardedMandate {
    Mandate mandate;
    DiscardReason reason{DiscardReason::LOWER_AUTHORITY};
    std::string detail;
};

/**
 * Sole output of arbitration for one symbol in one cycle.
 * An empty selection is NO_ACTION.
 */
struct ArbitrationResult {
    std::string symbol;
    uint64_t cycle{0};
    PositionState state{PositionState::FLAT};
    std::optional<Mandate> selected;
    std::vector<DiscardedMandate> discarded;
    std::vector<Mandate> forced;                // Injected this cycle
    VerdictKind assessment{VerdictKind::ALLOW}; // Proposal-independent verdict on the position
    std::string assessment_reason;
    bool halted{false};

    bool no_action() const { return !selected.has_value(); }

    void discard(const Mandate& m, DiscardReason reason, std::string detail = "") {
        discarded.push_back(DiscardedMandate{m, reason, std::move(detail)});
    }
};

} // namespace gate
