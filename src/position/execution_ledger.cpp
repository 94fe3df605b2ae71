#include "position/execution_ledger.hpp"
#include "common/errors.hpp"
#include "persistence/position_repository.hpp"
#include "position/lifecycle.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace gate {

namespace {

// State a position sits in while an order with this action is working
PositionState working_state(IntentAction action) {
    switch (action) {
        case IntentAction::OPEN: return PositionState::ENTERING;
        case IntentAction::REDUCE: return PositionState::REDUCING;
        case IntentAction::CLOSE: return PositionState::CLOSING;
    }
    return PositionState::FAILED;
}

Notional reserved_risk(const Position& p) {
    if (!p.holds_size() || p.stop_price <= 0) return 0.0;
    return p.size * std::abs(p.entry_price - p.stop_price);
}

} // namespace

ExecutionLedger::ExecutionLedger(const AccountSnapshot& initial, PositionRepository* repository)
    : account_(initial)
    , repository_(repository)
{
    if (repository_) {
        for (const auto& p : repository_->load_non_flat()) {
            positions_[p.symbol] = p;
        }
        spdlog::info("ExecutionLedger restored {} non-flat positions", positions_.size());
    }
}

LedgerSnapshot ExecutionLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot snap;
    snap.positions = positions_;
    snap.account = account_;
    return snap;
}

Position ExecutionLedger::position(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current(symbol);
}

AccountSnapshot ExecutionLedger::account() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return account_;
}

void ExecutionLedger::restore(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (position.state == PositionState::FLAT) {
        positions_.erase(position.symbol);
    } else {
        positions_[position.symbol] = position;
    }
    store(position);
}

void ExecutionLedger::set_account(const AccountSnapshot& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    account_ = account;
}

Position ExecutionLedger::current(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? Position::flat(symbol) : it->second;
}

Position ExecutionLedger::accept(const Position& pos, const ExecutionReport& report) const {
    // Repeated acknowledgement of a working order
    if (pos.state == working_state(report.action)) return pos;

    auto target = lifecycle::target_state(pos.state, report.action);
    if (!target) {
        throw IllegalTransition(fmt::format("{}: {} has no target from {}",
                                            pos.symbol,
                                            intent_action_to_string(report.action),
                                            position_state_to_string(pos.state)));
    }
    if (*target == pos.state) return pos;

    Position next = lifecycle::transition(pos, *target,
                                          lifecycle::initiating_mandate(pos.state, report.action));
    if (*target == PositionState::ENTERING) {
        if (report.direction == Direction::NONE) {
            throw IllegalTransition(fmt::format("{}: entry accepted without direction", pos.symbol));
        }
        next.direction = report.direction;
        next.stop_price = report.stop_price;
    }
    return next;
}

Position ExecutionLedger::complete(const Position& pos, const ExecutionReport& report, AccountSnapshot& account) const {
    Size qty = report.filled_quantity;
    if (qty > kEpsilon && !(report.fill_price > 0)) {
        throw IllegalTransition(fmt::format("{}: fill of {:.8f} without a price", pos.symbol, qty));
    }

    Position next = pos;
    Notional pnl = 0.0;

    switch (report.action) {
        case IntentAction::OPEN: {
            if (qty <= kEpsilon) {
                throw IllegalTransition(fmt::format("{}: OPEN filled with zero quantity", pos.symbol));
            }
            if (report.direction != Direction::NONE && report.direction != pos.direction) {
                throw IllegalTransition(fmt::format("{}: {} fill against {} position", pos.symbol,
                                                    direction_to_string(report.direction),
                                                    direction_to_string(pos.direction)));
            }
            if (pos.state == PositionState::ENTERING) {
                next = lifecycle::transition(pos, PositionState::OPEN);
                next.size = lifecycle::size_after_fill(pos, IntentAction::OPEN, qty);
                next.entry_price = report.fill_price;
                if (report.stop_price > 0) next.stop_price = report.stop_price;
            } else if (pos.state == PositionState::OPEN) {
                next.entry_price = lifecycle::blended_entry_price(pos, qty, report.fill_price);
                next.size = lifecycle::size_after_fill(pos, IntentAction::OPEN, qty);
                next.stop_price = tighter_stop(pos.direction, pos.stop_price, report.stop_price);
            } else {
                throw IllegalTransition(fmt::format("{}: OPEN fill in {}", pos.symbol,
                                                    position_state_to_string(pos.state)));
            }
            break;
        }
        case IntentAction::REDUCE: {
            if (pos.state != PositionState::REDUCING) {
                throw IllegalTransition(fmt::format("{}: REDUCE fill in {}", pos.symbol,
                                                    position_state_to_string(pos.state)));
            }
            Size remaining = lifecycle::size_after_fill(pos, IntentAction::REDUCE, qty);
            pnl = direction_sign(pos.direction) * (report.fill_price - pos.entry_price) * qty;
            next.size = remaining;
            if (remaining > kEpsilon) {
                next = lifecycle::transition(next, PositionState::OPEN);
            } else {
                next = lifecycle::transition(next, PositionState::CLOSING);
                next = lifecycle::transition(next, PositionState::CLOSED);
                next = lifecycle::transition(next, PositionState::FLAT);
            }
            break;
        }
        case IntentAction::CLOSE: {
            if (pos.state != PositionState::CLOSING) {
                throw IllegalTransition(fmt::format("{}: CLOSE fill in {}", pos.symbol,
                                                    position_state_to_string(pos.state)));
            }
            Size remaining = lifecycle::size_after_fill(pos, IntentAction::CLOSE, qty);
            if (qty > kEpsilon) {
                pnl = direction_sign(pos.direction) * (report.fill_price - pos.entry_price) * qty;
            }
            next.size = remaining;
            // Partial close stays CLOSING until the rest is confirmed
            if (remaining <= kEpsilon) {
                next = lifecycle::transition(next, PositionState::CLOSED);
                next = lifecycle::transition(next, PositionState::FLAT);
            }
            break;
        }
    }

    next.risk_reserved = reserved_risk(next);

    account.realized_pnl += pnl;
    account.fees_paid += report.fee;
    account.equity += pnl - report.fee;
    account.margin_available += pnl - report.fee;
    account.sequence += 1;

    return next;
}

Position ExecutionLedger::apply(const Position& pos, const ExecutionReport& report, AccountSnapshot& account) const {
    switch (report.status) {
        case ReportStatus::ACCEPTED:
            return accept(pos, report);
        case ReportStatus::FILLED:
            return complete(accept(pos, report), report, account);
        case ReportStatus::REJECTED:
            // Nothing was working, nothing changed at the venue
            if (pos.state == PositionState::FLAT || pos.state == PositionState::OPEN ||
                pos.state == PositionState::FAILED) {
                spdlog::warn("{} {} rejected in {}, position unchanged", pos.symbol,
                             intent_action_to_string(report.action),
                             position_state_to_string(pos.state));
                return pos;
            }
            spdlog::error("{} working {} rejected in {}, venue state unknown", pos.symbol,
                          intent_action_to_string(report.action),
                          position_state_to_string(pos.state));
            return lifecycle::transition(pos, PositionState::FAILED);
    }
    return pos;
}

LedgerUpdate ExecutionLedger::commit(const Position& before, const ExecutionReport& report) {
    LedgerUpdate update;
    AccountSnapshot account = account_;

    try {
        Position next = apply(before, report, account);
        next.last_update_cycle = report.cycle;
        update.position = next;
    } catch (const IllegalTransition& e) {
        Position failed = before;
        if (lifecycle::is_legal_transition(before.state, PositionState::FAILED)) {
            failed.state = PositionState::FAILED;
        }
        failed.last_update_cycle = report.cycle;
        update.position = failed;
        update.violation = true;
        update.detail = e.what();
        account = account_;

        spdlog::critical("Illegal transition on {} (trigger {}): {}", report.symbol, report.trigger_id, e.what());
    }

    // Persist before touching memory; a failed write leaves the ledger as it was
    store(update.position);

    account_ = account;
    update.account = account_;
    if (update.position.state == PositionState::FLAT) {
        positions_.erase(update.position.symbol);
    } else {
        positions_[update.position.symbol] = update.position;
    }

    if (!update.violation) {
        spdlog::info("{} {} {}: {} -> {} size={:.8f}",
                     report.symbol,
                     intent_action_to_string(report.action),
                     report_status_to_string(report.status),
                     position_state_to_string(before.state),
                     position_state_to_string(update.position.state),
                     update.position.size);
    }

    return update;
}

LedgerUpdate ExecutionLedger::on_intent_submitted(const ExecutionIntent& intent, uint64_t cycle) {
    ExecutionReport report;
    report.symbol = intent.symbol;
    report.action = intent.action;
    report.status = ReportStatus::ACCEPTED;
    report.direction = intent.direction;
    report.stop_price = intent.stop_price;
    report.trigger_id = intent.trigger_id;
    report.cycle = cycle;
    return on_execution_confirmed(report);
}

LedgerUpdate ExecutionLedger::on_execution_confirmed(const ExecutionReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (report.symbol.empty()) {
        LedgerUpdate update;
        update.account = account_;
        update.violation = true;
        update.detail = "execution report without symbol";
        spdlog::error("Ignoring execution report without symbol (trigger {})", report.trigger_id);
        return update;
    }

    return commit(current(report.symbol), report);
}

LedgerUpdate ExecutionLedger::reconcile_failed(const std::string& symbol, const std::string& operator_note) {
    std::lock_guard<std::mutex> lock(mutex_);

    LedgerUpdate update;
    update.position = current(symbol);
    update.account = account_;

    if (operator_note.empty()) {
        update.violation = true;
        update.detail = "operator note required";
    } else if (update.position.state != PositionState::FAILED) {
        update.violation = true;
        update.detail = symbol + " is not FAILED";
    } else if (update.position.holds_size()) {
        update.violation = true;
        update.detail = fmt::format("{} still holds {:.8f}, EXIT required", symbol, update.position.size);
    }

    if (update.violation) {
        spdlog::warn("Reconcile of {} refused: {}", symbol, update.detail);
        return update;
    }

    Position next = lifecycle::transition(update.position, PositionState::CLOSING, MandateType::EXIT);
    next = lifecycle::transition(next, PositionState::CLOSED);
    next = lifecycle::transition(next, PositionState::FLAT);

    store(next);
    positions_.erase(symbol);
    update.position = next;

    spdlog::warn("{} reconciled from FAILED by operator: {}", symbol, operator_note);
    return update;
}

void ExecutionLedger::mark(const std::string& symbol, double liquidation_distance) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return;
    Position next = it->second;
    next.liquidation_distance = liquidation_distance;
    store(next);
    it->second = next;
}

void ExecutionLedger::store(const Position& position) {
    if (!repository_) return;
    if (position.state == PositionState::FLAT) {
        repository_->remove(position.symbol);
    } else {
        repository_->save(position);
    }
}

} // namespace gate
