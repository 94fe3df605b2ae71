#pragma once

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include "common/types.hpp"
#include "config/config.hpp"

namespace gate {

/**
 * Numeric facts for one symbol at cycle start.
 *
 * Primitives are counts, rates, distances and volumes computed by the
 * external observation layer. There is no field for a label: interpreted
 * categories cannot be represented here.
 */
struct MarketSnapshot {
    std::string symbol;
    uint64_t sequence{0};
    Price mark_price{0.0};
    Price liquidation_price{0.0};   // Venue-reported, 0 = not reported
    int64_t age_ms{0};
    std::map<std::string, double> primitives;
};

struct IntegrityReport {
    bool ok{true};
    std::vector<std::string> issues;
};

/**
 * Admissibility contract for snapshots entering the core.
 *
 * A failed check is a DataIntegrityFailure for that symbol only: the symbol
 * may BLOCK or HOLD, never ENTER or ADD.
 */
class ObservationGate {
public:
    explicit ObservationGate(const IntegrityConfig& config);

    IntegrityReport check(const MarketSnapshot& snapshot) const;

    // True if any '_'-separated token of the name is a forbidden term
    bool is_interpretive(const std::string& primitive_name) const;

private:
    IntegrityConfig config_;
};

} // namespace gate
