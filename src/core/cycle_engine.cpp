#include "core/cycle_engine.hpp"
#include "persistence/audit_journal.hpp"
#include "position/lifecycle.hpp"
#include "risk/portfolio_facts.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <set>
#include <thread>

namespace gate {

CycleEngine::CycleEngine(const Config& config,
                         ExecutionLedger& ledger,
                         HaltController& halt,
                         AuditJournal* journal)
    : config_(config)
    , ledger_(ledger)
    , halt_(halt)
    , journal_(journal)
    , evaluator_(config.risk)
    , arbitrator_(evaluator_)
    , constructor_(evaluator_)
    , gate_(config.integrity)
{
}

void CycleEngine::add_source(std::unique_ptr<MandateSource> source) {
    registry_.add(std::move(source));
}

void CycleEngine::journal_halt(uint64_t cycle) {
    if (!journal_) return;
    HaltEvent event;
    event.timestamp = wall_now();
    event.cycle = cycle;
    event.reason = halt_.reason();
    event.details = halt_.details();
    event.is_activation = true;
    journal_->record_halt(event);
}

SymbolOutcome CycleEngine::evaluate_symbol(const SymbolWork& work) const {
    const auto& input = work.context.input;

    SymbolOutcome outcome;
    outcome.integrity = work.integrity;
    outcome.metrics = evaluator_.compute_metrics(input);
    outcome.arbitration = arbitrator_.arbitrate(work.context, work.mandates);

    auto& result = outcome.arbitration;
    if (!result.selected) return outcome;

    const Mandate selected = *result.selected;
    if (selected.type == MandateType::BLOCK || selected.type == MandateType::HOLD) {
        return outcome;
    }

    // Legality re-check against the state machine before anything is emitted
    std::optional<ExecutionIntent> intent;
    std::string detail;
    if (!lifecycle::is_admissible(input.position.state, selected.type)) {
        detail = fmt::format("{} not admissible in {}", mandate_type_to_string(selected.type),
                             position_state_to_string(input.position.state));
    } else {
        intent = constructor_.construct(selected, input);
        if (intent && !lifecycle::target_state(input.position.state, intent->action)) {
            detail = fmt::format("{} has no target from {}", intent_action_to_string(intent->action),
                                 position_state_to_string(input.position.state));
            intent.reset();
        } else if (!intent) {
            detail = fmt::format("no executable {} size", mandate_type_to_string(selected.type));
        }
    }

    if (!intent) {
        result.selected.reset();
        result.discard(selected, DiscardReason::INTENT_SUPPRESSED, detail);
        return outcome;
    }

    outcome.intent = intent;
    return outcome;
}

CycleReport CycleEngine::run_cycle(const CycleInput& input) {
    const uint64_t cycle = input.cycle;

    CycleReport report;
    report.cycle = cycle;

    // Read once; nothing below writes the ledger until the outcomes are in
    LedgerSnapshot snapshot = ledger_.snapshot();

    std::map<std::string, Price> marks;
    for (const auto& [symbol, market] : input.markets) {
        marks[symbol] = market.mark_price;
    }
    PortfolioFacts facts = compute_portfolio_facts(snapshot.positions, marks, snapshot.account, config_.risk);

    if (halt_.check_failed_positions(snapshot.positions, cycle) ||
        halt_.check_feed_integrity(input.feed_integrity_lost, cycle) ||
        halt_.check_correlated_breach(facts, cycle)) {
        journal_halt(cycle);
    }
    const bool halted = halt_.is_halted();
    report.halted = halted;
    report.halt_reason = halt_.reason();

    std::set<std::string> symbols;
    for (const auto& [symbol, market] : input.markets) {
        symbols.insert(symbol);
    }
    for (const auto& [symbol, position] : snapshot.positions) {
        if (position.state != PositionState::FLAT) symbols.insert(symbol);
    }

    std::map<std::string, std::vector<Mandate>> by_symbol;
    for (const auto& m : input.mandates) {
        if (m.symbol.empty()) {
            spdlog::warn("Cycle {}: dropping mandate {} without symbol", cycle, m.trigger_id);
            continue;
        }
        symbols.insert(m.symbol);
        by_symbol[m.symbol].push_back(m);
        report.stats.mandates_received++;
    }

    // Sources are called serially; they may keep state of their own
    std::vector<SymbolWork> work;
    work.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        SymbolWork w;
        Position position = snapshot.position(symbol);

        MarketSnapshot market;
        auto it = input.markets.find(symbol);
        if (it != input.markets.end()) {
            market = it->second;
            if (market.symbol.empty()) market.symbol = symbol;
            w.integrity = gate_.check(market);
        } else {
            market.symbol = symbol;
            market.mark_price = position.entry_price;
            w.integrity.ok = false;
            w.integrity.issues.push_back("no market snapshot");
        }
        if (input.feed_integrity_lost) {
            w.integrity.ok = false;
            w.integrity.issues.push_back("observation feed integrity lost");
        }

        w.mandates = by_symbol[symbol];
        auto proposed = registry_.collect(market, position, cycle);
        report.stats.mandates_received += proposed.size();
        w.mandates.insert(w.mandates.end(), proposed.begin(), proposed.end());

        w.context.cycle = cycle;
        w.context.halted = halted;
        w.context.input.position = position;
        w.context.input.account = snapshot.account;
        w.context.input.market = market;
        w.context.input.portfolio = facts;
        w.context.input.integrity_ok = w.integrity.ok;

        if (!w.integrity.ok) {
            spdlog::warn("Cycle {}: {} integrity failure: {}", cycle, symbol, w.integrity.issues.front());
        }
        work.push_back(std::move(w));
    }

    if (config_.engine.parallel_symbols && work.size() > 1) {
        // One worker per symbol; each writes only its own slot
        report.outcomes.resize(work.size());
        std::vector<std::exception_ptr> errors(work.size());
        std::vector<std::thread> workers;
        workers.reserve(work.size());
        for (size_t i = 0; i < work.size(); ++i) {
            workers.emplace_back([this, &work, &report, &errors, i]() {
                try {
                    report.outcomes[i] = evaluate_symbol(work[i]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        for (auto& t : workers) {
            t.join();
        }
        for (const auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    } else {
        for (const auto& w : work) {
            report.outcomes.push_back(evaluate_symbol(w));
        }
    }

    for (auto& outcome : report.outcomes) {
        const auto& result = outcome.arbitration;

        if (result.state != PositionState::FLAT) {
            ledger_.mark(result.symbol, outcome.metrics.liquidation_distance);
        }
        if (journal_) {
            outcome.fingerprint = journal_->record_outcome(cycle, outcome);
        }

        report.stats.symbols++;
        report.stats.discards += result.discarded.size();
        report.stats.forced += result.forced.size();
        if (outcome.intent) {
            report.stats.intents_emitted++;
            spdlog::info("Cycle {}: {} {} {} qty={:.8f} ({})", cycle, result.symbol,
                         intent_action_to_string(outcome.intent->action),
                         direction_to_string(outcome.intent->direction),
                         outcome.intent->quantity, outcome.intent->trigger_id);
        } else {
            spdlog::debug("Cycle {}: {} NO_ACTION ({} discarded)", cycle, result.symbol,
                          result.discarded.size());
        }
    }

    if (journal_) {
        journal_->flush();
    }

    spdlog::info("Cycle {} complete: symbols={} mandates={} intents={} discards={} forced={}{}",
                 cycle, report.stats.symbols, report.stats.mandates_received,
                 report.stats.intents_emitted, report.stats.discards, report.stats.forced,
                 halted ? " [HALTED]" : "");

    return report;
}

LedgerUpdate CycleEngine::on_execution_confirmed(const ExecutionReport& report) {
    LedgerUpdate update = ledger_.on_execution_confirmed(report);
    if (update.violation && update.position.state == PositionState::FAILED) {
        if (halt_.activate(HaltReason::ILLEGAL_TRANSITION, update.detail, report.cycle)) {
            journal_halt(report.cycle);
        }
    }
    return update;
}

} // namespace gate
