#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include "common/types.hpp"
#include "position/position.hpp"
#include "risk/portfolio_facts.hpp"

namespace gate {

/**
 * Halt reasons.
 */
enum class HaltReason {
    NONE,
    MANUAL,               // Operator initiated
    FAILED_POSITION,      // A position reached FAILED
    DATA_INTEGRITY_LOSS,  // Observation feed lost as a whole
    CORRELATED_BREACH,    // Correlated exposure beyond the hard ceiling
    ILLEGAL_TRANSITION    // Lifecycle violation reported by the ledger
};

inline std::string halt_reason_to_string(HaltReason r) {
    switch (r) {
        case HaltReason::NONE: return "NONE";
        case HaltReason::MANUAL: return "MANUAL";
        case HaltReason::FAILED_POSITION: return "FAILED_POSITION";
        case HaltReason::DATA_INTEGRITY_LOSS: return "DATA_INTEGRITY_LOSS";
        case HaltReason::CORRELATED_BREACH: return "CORRELATED_BREACH";
        case HaltReason::ILLEGAL_TRANSITION: return "ILLEGAL_TRANSITION";
    }
    return "UNKNOWN";
}

/**
 * Halt event for audit trail.
 */
struct HaltEvent {
    WallClock timestamp;
    uint64_t cycle{0};
    HaltReason reason{HaltReason::NONE};
    std::string details;
    bool is_activation{true};  // false = operator reset
};

/**
 * Latched global halt.
 *
 * - Activation is atomic; the first reason wins until reset
 * - Only an explicit operator reset clears it, there is no auto-recovery
 * - While halted every non-EXIT mandate is suppressed
 * - Every activation and reset is kept for audit
 */
class HaltController {
public:
    using Callback = std::function<void(HaltReason, const std::string&)>;

    explicit HaltController(size_t history_limit = 1000);

    bool is_halted() const { return halted_.load(std::memory_order_acquire); }
    HaltReason reason() const;
    std::string details() const;

    // Returns true if this call latched the halt
    bool activate(HaltReason reason, const std::string& details, uint64_t cycle = 0);
    bool activate_manual(const std::string& operator_note, uint64_t cycle = 0);

    // Requires a non-empty operator note
    bool reset(const std::string& operator_note);

    // Cycle-start checks; each returns true if it latched the halt
    bool check_failed_positions(const std::map<std::string, Position>& positions, uint64_t cycle);
    bool check_feed_integrity(bool feed_integrity_lost, uint64_t cycle);
    bool check_correlated_breach(const PortfolioFacts& facts, uint64_t cycle);

    void set_callback(Callback cb);

    std::vector<HaltEvent> get_event_history() const;

private:
    std::atomic<bool> halted_{false};
    size_t history_limit_;

    mutable std::mutex state_mutex_;
    HaltReason current_reason_{HaltReason::NONE};
    std::string current_details_;

    mutable std::mutex history_mutex_;
    std::vector<HaltEvent> event_history_;

    std::mutex callback_mutex_;
    Callback callback_;

    void record_event(HaltReason reason, const std::string& details, uint64_t cycle, bool is_activation);
    void invoke_callback(HaltReason reason, const std::string& details);
};

} // namespace gate
