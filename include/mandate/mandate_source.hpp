#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include "mandate/mandate.hpp"
#include "observation/observation.hpp"
#include "position/position.hpp"

namespace gate {

/**
 * Contract for the external strategy/condition layer.
 *
 * A source sees the same numeric snapshot and position the core sees and
 * returns typed mandates for that symbol. Everything it returns is untrusted
 * and goes through the same filters as forced mandates.
 */
class MandateSource {
public:
    virtual ~MandateSource() = default;

    virtual std::string name() const = 0;

    virtual std::vector<Mandate> propose(
        const MarketSnapshot& snapshot,
        const Position& position,
        uint64_t cycle
    ) = 0;
};

/**
 * Owns the registered sources and gathers their proposals per symbol.
 * A source that throws contributes nothing for that symbol this cycle.
 */
class MandateRegistry {
public:
    MandateRegistry() = default;

    MandateRegistry(const MandateRegistry&) = delete;
    MandateRegistry& operator=(const MandateRegistry&) = delete;

    void add(std::unique_ptr<MandateSource> source);
    size_t size() const { return sources_.size(); }

    std::vector<Mandate> collect(
        const MarketSnapshot& snapshot,
        const Position& position,
        uint64_t cycle
    ) const;

private:
    std::vector<std::unique_ptr<MandateSource>> sources_;
};

} // namespace gate
