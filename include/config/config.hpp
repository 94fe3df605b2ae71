#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include "common/types.hpp"

namespace gate {

/**
 * Risk envelope. External configuration, read-only to the engine.
 * Exposure and leverage caps are multiples of account equity.
 */
struct RiskEnvelope {
    double max_risk_per_trade{0.01};          // Loss at stop <= 1% of equity
    double max_account_exposure{10.0};        // Total notional <= 10x equity
    double max_symbol_exposure{5.0};          // Single symbol notional <= 5x equity
    double min_liquidation_buffer{0.08};      // Distance to liquidation >= 8%
    double critical_liquidation_buffer{0.03}; // Below 3% the only answer is EXIT
    double max_effective_leverage{10.0};
    double maintenance_margin_rate{0.005};
    double max_correlated_exposure{6.0};      // Net notional per correlation group
    double correlated_hard_ceiling{8.0};      // Beyond this the engine halts
    double min_free_margin_pct{0.10};         // Free margin >= 10% of equity to grow
    std::map<std::string, std::vector<std::string>> correlation_groups;
    double default_reduce_fraction{0.5};
    double quantity_step{0.0};                // 0 = continuous quantities
    double min_order_quantity{0.0};

    bool validate() const;

    // Groups a symbol belongs to, in name order
    std::vector<std::string> groups_for(const std::string& symbol) const;
};

/**
 * Admissibility contract for observation snapshots.
 */
struct IntegrityConfig {
    std::vector<std::string> required_primitives;
    int64_t max_snapshot_age_ms{5000};
    std::vector<std::string> forbidden_terms{
        "signal", "strength", "confidence", "quality", "opportunity", "bias",
        "setup", "weak", "strong", "support", "resistance", "momentum",
        "reversal", "bullish", "bearish", "absorption", "zone", "pressure",
        "sentiment", "exhaustion", "trap", "hunt"
    };
};

struct EngineConfig {
    bool parallel_symbols{false};
    int halt_history_limit{1000};
};

/**
 * Diagnostics only. Cycle results go to stdout and the audit journal,
 * never through these sinks.
 */
struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_file{"mandate_gate.log"};
    std::string log_level{"info"};           // trace, debug, info, warn, error, critical, off
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};

    bool validate() const;

    std::string log_file_path() const;

    // Unknown names map to off; validate() rejects them
    spdlog::level::level_enum level() const;
};

struct AuditConfig {
    std::string journal_path{"./data/audit.jsonl"};
    std::string positions_db_path;           // Empty = no position persistence
};

struct Config {
    RiskEnvelope risk;
    IntegrityConfig integrity;
    EngineConfig engine;
    LoggingConfig logging;
    AuditConfig audit;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;
};

// JSON serialization
void to_json(nlohmann::json& j, const RiskEnvelope& c);
void from_json(const nlohmann::json& j, RiskEnvelope& c);
void to_json(nlohmann::json& j, const IntegrityConfig& c);
void from_json(const nlohmann::json& j, IntegrityConfig& c);
void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const AuditConfig& c);
void from_json(const nlohmann::json& j, AuditConfig& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace gate
