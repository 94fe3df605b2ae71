#include "core/halt_controller.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace gate {

HaltController::HaltController(size_t history_limit)
    : history_limit_(history_limit == 0 ? 1 : history_limit)
{
}

HaltReason HaltController::reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_reason_;
}

std::string HaltController::details() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_details_;
}

bool HaltController::activate(HaltReason reason, const std::string& details, uint64_t cycle) {
    // Only the first activation latches
    bool expected = false;
    if (!halted_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("Halt already active, ignoring {}: {}", halt_reason_to_string(reason), details);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current_reason_ = reason;
        current_details_ = details;
    }

    record_event(reason, details, cycle, true);

    spdlog::critical("HALT ACTIVATED at cycle {}: reason={}, details={}",
                     cycle, halt_reason_to_string(reason), details);

    invoke_callback(reason, details);
    return true;
}

bool HaltController::activate_manual(const std::string& operator_note, uint64_t cycle) {
    return activate(HaltReason::MANUAL, operator_note.empty() ? "Manual activation" : operator_note, cycle);
}

bool HaltController::reset(const std::string& operator_note) {
    if (operator_note.empty()) {
        spdlog::warn("Halt reset refused: an operator note is required");
        return false;
    }

    bool expected = true;
    if (!halted_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        spdlog::warn("Halt reset requested but not active");
        return false;
    }

    HaltReason prev_reason;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        prev_reason = current_reason_;
        current_reason_ = HaltReason::NONE;
        current_details_.clear();
    }

    record_event(prev_reason, operator_note, 0, false);

    spdlog::warn("HALT RESET by operator (was {}): {}", halt_reason_to_string(prev_reason), operator_note);
    return true;
}

bool HaltController::check_failed_positions(const std::map<std::string, Position>& positions, uint64_t cycle) {
    if (is_halted()) return false;

    for (const auto& [symbol, position] : positions) {
        if (position.state == PositionState::FAILED) {
            return activate(HaltReason::FAILED_POSITION,
                            fmt::format("{} is FAILED with size {:.8f}", symbol, position.size),
                            cycle);
        }
    }
    return false;
}

bool HaltController::check_feed_integrity(bool feed_integrity_lost, uint64_t cycle) {
    if (is_halted() || !feed_integrity_lost) return false;
    return activate(HaltReason::DATA_INTEGRITY_LOSS, "observation feed integrity lost", cycle);
}

bool HaltController::check_correlated_breach(const PortfolioFacts& facts, uint64_t cycle) {
    if (is_halted() || !facts.hard_ceiling_breached) return false;

    double ratio = facts.equity > 0 ? std::abs(facts.group_net(facts.breached_group)) / facts.equity : 0.0;
    return activate(HaltReason::CORRELATED_BREACH,
                    fmt::format("group {} correlated exposure {:.4f} beyond hard ceiling",
                                facts.breached_group, ratio),
                    cycle);
}

void HaltController::set_callback(Callback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(cb);
}

std::vector<HaltEvent> HaltController::get_event_history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return event_history_;
}

void HaltController::record_event(HaltReason reason, const std::string& details, uint64_t cycle, bool is_activation) {
    std::lock_guard<std::mutex> lock(history_mutex_);

    HaltEvent event;
    event.timestamp = wall_now();
    event.cycle = cycle;
    event.reason = reason;
    event.details = details;
    event.is_activation = is_activation;
    event_history_.push_back(std::move(event));

    if (event_history_.size() > history_limit_) {
        event_history_.erase(event_history_.begin(),
                             event_history_.begin() + (event_history_.size() - history_limit_));
    }
}

void HaltController::invoke_callback(HaltReason reason, const std::string& details) {
    Callback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    }
    if (cb) {
        cb(reason, details);
    }
}

} // namespace gate
