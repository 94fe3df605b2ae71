#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include "arbitration/arbitrator.hpp"
#include "config/config.hpp"
#include "core/cycle_report.hpp"
#include "core/halt_controller.hpp"
#include "execution/intent_constructor.hpp"
#include "mandate/mandate_source.hpp"
#include "observation/observation.hpp"
#include "position/execution_ledger.hpp"
#include "risk/invariant_evaluator.hpp"

namespace gate {

class AuditJournal;

/**
 * One cycle's observations. Markets are keyed by symbol.
 */
struct CycleInput {
    uint64_t cycle{0};
    std::map<std::string, MarketSnapshot> markets;
    std::vector<Mandate> mandates;
    bool feed_integrity_lost{false};
};

/**
 * Runs evaluation cycles.
 *
 * Per cycle: snapshot the ledger, compute portfolio facts, run the halt
 * checks, then per symbol gate -> arbitrate -> legality re-check -> construct.
 * Symbols are independent and may run concurrently; nothing inside a symbol
 * pipeline touches the ledger. Results are journaled in symbol order.
 */
class CycleEngine {
public:
    CycleEngine(const Config& config,
                ExecutionLedger& ledger,
                HaltController& halt,
                AuditJournal* journal = nullptr);

    CycleEngine(const CycleEngine&) = delete;
    CycleEngine& operator=(const CycleEngine&) = delete;

    void add_source(std::unique_ptr<MandateSource> source);

    CycleReport run_cycle(const CycleInput& input);

    // Forwards to the ledger; a lifecycle violation latches the halt
    LedgerUpdate on_execution_confirmed(const ExecutionReport& report);

    const InvariantEvaluator& evaluator() const { return evaluator_; }

private:
    Config config_;
    ExecutionLedger& ledger_;
    HaltController& halt_;
    AuditJournal* journal_;

    InvariantEvaluator evaluator_;
    MandateArbitrator arbitrator_;
    IntentConstructor constructor_;
    ObservationGate gate_;
    MandateRegistry registry_;

    struct SymbolWork {
        ArbitrationContext context;
        std::vector<Mandate> mandates;
        IntegrityReport integrity;
    };

    SymbolOutcome evaluate_symbol(const SymbolWork& work) const;
    void journal_halt(uint64_t cycle);
};

} // namespace gate
