#include "mandate/mandate_source.hpp"
#include <spdlog/spdlog.h>

namespace gate {

void MandateRegistry::add(std::unique_ptr<MandateSource> source) {
    if (!source) return;
    spdlog::info("Mandate source registered: {}", source->name());
    sources_.push_back(std::move(source));
}

std::vector<Mandate> MandateRegistry::collect(
    const MarketSnapshot& snapshot,
    const Position& position,
    uint64_t cycle) const
{
    std::vector<Mandate> result;

    for (const auto& source : sources_) {
        try {
            auto proposed = source->propose(snapshot, position, cycle);
            result.insert(result.end(), proposed.begin(), proposed.end());
        } catch (const std::exception& e) {
            spdlog::error("Mandate source {} failed for {} at cycle {}: {}",
                          source->name(), snapshot.symbol, cycle, e.what());
        }
    }

    return result;
}

} // namespace gate
