#pragma once

#include <map>
#include <mutex>
#include <string>
#include "common/types.hpp"
#include "execution/execution_intent.hpp"
#include "position/position.hpp"

namespace gate {

class PositionRepository;

/**
 * Result of one confirmed-execution callback: the next position and the next
 * account snapshot. violation is set when the report implied an illegal
 * transition and the position was moved to FAILED instead.
 */
struct LedgerUpdate {
    Position position;
    AccountSnapshot account;
    bool violation{false};
    std::string detail;
};

// Immutable copy taken at cycle start
struct LedgerSnapshot {
    std::map<std::string, Position> positions;
    AccountSnapshot account;

    Position position(const std::string& symbol) const {
        auto it = positions.find(symbol);
        return it == positions.end() ? Position::flat(symbol) : it->second;
    }
};

/**
 * Positions and account equity, the only shared mutable state.
 *
 * Mutated exclusively by confirmed execution results; emitting an intent
 * changes nothing here. Every lifecycle move goes through the state machine,
 * so an out-of-table report lands the symbol in FAILED.
 *
 * With a repository attached the new state is persisted first; a storage
 * error propagates and leaves positions and account untouched.
 */
class ExecutionLedger {
public:
    explicit ExecutionLedger(const AccountSnapshot& initial,
                             PositionRepository* repository = nullptr);

    // Non-copyable
    ExecutionLedger(const ExecutionLedger&) = delete;
    ExecutionLedger& operator=(const ExecutionLedger&) = delete;

    LedgerSnapshot snapshot() const;
    Position position(const std::string& symbol) const;
    AccountSnapshot account() const;

    // Seed state from an external source (restart, replay input)
    void restore(const Position& position);
    void set_account(const AccountSnapshot& account);

    // Broker accepted the order: FLAT->ENTERING, ->REDUCING or ->CLOSING
    LedgerUpdate on_intent_submitted(const ExecutionIntent& intent, uint64_t cycle);

    LedgerUpdate on_execution_confirmed(const ExecutionReport& report);

    // Operator intervention for a FAILED position that no longer holds size
    LedgerUpdate reconcile_failed(const std::string& symbol, const std::string& operator_note);

    // Latest evaluated liquidation distance
    void mark(const std::string& symbol, double liquidation_distance);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Position> positions_;
    AccountSnapshot account_;
    PositionRepository* repository_;

    Position current(const std::string& symbol) const;
    Position accept(const Position& position, const ExecutionReport& report) const;
    Position complete(const Position& position, const ExecutionReport& report, AccountSnapshot& account) const;
    Position apply(const Position& position, const ExecutionReport& report, AccountSnapshot& account) const;
    LedgerUpdate commit(const Position& before, const ExecutionReport& report);
    void store(const Position& position);
};

} // namespace gate
