#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include "arbitration/arbitration_result.hpp"
#include "core/halt_controller.hpp"
#include "execution/execution_intent.hpp"
#include "observation/observation.hpp"
#include "risk/invariant_evaluator.hpp"

namespace gate {

/**
 * Everything decided for one symbol in one cycle.
 */
struct SymbolOutcome {
    ArbitrationResult arbitration;
    std::optional<ExecutionIntent> intent;
    IntegrityReport integrity;
    RiskMetrics metrics;
    std::string fingerprint;    // SHA-256 of the journaled record, empty if not journaled
};

struct CycleStats {
    size_t symbols{0};
    size_t mandates_received{0};
    size_t intents_emitted{0};
    size_t discards{0};
    size_t forced{0};
};

struct CycleReport {
    uint64_t cycle{0};
    bool halted{false};
    HaltReason halt_reason{HaltReason::NONE};
    std::vector<SymbolOutcome> outcomes;    // Ordered by symbol
    CycleStats stats;

    const SymbolOutcome* find(const std::string& symbol) const {
        for (const auto& o : outcomes) {
            if (o.arbitration.symbol == symbol) return &o;
        }
        return nullptr;
    }

    std::vector<ExecutionIntent> intents() const {
        std::vector<ExecutionIntent> result;
        for (const auto& o : outcomes) {
            if (o.intent) result.push_back(*o.intent);
        }
        return result;
    }
};

} // namespace gate
