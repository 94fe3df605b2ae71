#pragma once

#include <nlohmann/json.hpp>
#include "arbitration/arbitration_result.hpp"
#include "core/cycle_report.hpp"
#include "execution/execution_intent.hpp"
#include "mandate/mandate.hpp"
#include "observation/observation.hpp"
#include "position/position.hpp"
#include "risk/invariant_evaluator.hpp"

namespace gate {

// JSON serialization for domain types. Enums travel as their string names;
// an unknown name throws DataIntegrityFailure. Optional fields are written
// only when set.

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const AccountSnapshot& a);
void from_json(const nlohmann::json& j, AccountSnapshot& a);

void to_json(nlohmann::json& j, const ExecutionReport& r);
void from_json(const nlohmann::json& j, ExecutionReport& r);

void to_json(nlohmann::json& j, const MarketSnapshot& s);
void from_json(const nlohmann::json& j, MarketSnapshot& s);

void to_json(nlohmann::json& j, const IntegrityReport& r);

void to_json(nlohmann::json& j, const MandateScope& s);
void from_json(const nlohmann::json& j, MandateScope& s);

// A missing authority_rank defaults to the type's rank
void to_json(nlohmann::json& j, const Mandate& m);
void from_json(const nlohmann::json& j, Mandate& m);

void to_json(nlohmann::json& j, const ExecutionIntent& i);
void from_json(const nlohmann::json& j, ExecutionIntent& i);

void to_json(nlohmann::json& j, const DiscardedMandate& d);
void to_json(nlohmann::json& j, const ArbitrationResult& r);
void to_json(nlohmann::json& j, const RiskMetrics& m);

// Fingerprint is not part of the record it fingerprints
void to_json(nlohmann::json& j, const SymbolOutcome& o);

} // namespace gate
