#include "config/config.hpp"
#include "common/errors.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace gate {

bool RiskEnvelope::validate() const {
    if (max_risk_per_trade <= 0 || max_risk_per_trade > 1.0) {
        spdlog::error("max_risk_per_trade must be in (0, 1]");
        return false;
    }

    if (max_effective_leverage <= 0) {
        spdlog::error("max_effective_leverage must be positive");
        return false;
    }

    if (max_account_exposure <= 0 || max_symbol_exposure <= 0 || max_correlated_exposure <= 0) {
        spdlog::error("exposure caps must be positive");
        return false;
    }

    if (max_symbol_exposure > max_account_exposure) {
        spdlog::warn("max_symbol_exposure {:.2f} exceeds max_account_exposure {:.2f}",
                     max_symbol_exposure, max_account_exposure);
    }

    if (correlated_hard_ceiling < max_correlated_exposure) {
        spdlog::error("correlated_hard_ceiling must be >= max_correlated_exposure");
        return false;
    }

    if (min_liquidation_buffer <= 0 || min_liquidation_buffer >= 1.0) {
        spdlog::error("min_liquidation_buffer must be in (0, 1)");
        return false;
    }

    if (critical_liquidation_buffer < 0 || critical_liquidation_buffer > min_liquidation_buffer) {
        spdlog::error("critical_liquidation_buffer must be in [0, min_liquidation_buffer]");
        return false;
    }

    if (maintenance_margin_rate < 0 || maintenance_margin_rate >= 1.0) {
        spdlog::error("maintenance_margin_rate must be in [0, 1)");
        return false;
    }

    if (min_free_margin_pct < 0 || min_free_margin_pct >= 1.0) {
        spdlog::error("min_free_margin_pct must be in [0, 1)");
        return false;
    }

    if (default_reduce_fraction <= 0 || default_reduce_fraction >= 1.0) {
        spdlog::error("default_reduce_fraction must be in (0, 1)");
        return false;
    }

    if (quantity_step < 0 || min_order_quantity < 0) {
        spdlog::error("quantity_step and min_order_quantity must be non-negative");
        return false;
    }

    return true;
}

std::vector<std::string> RiskEnvelope::groups_for(const std::string& symbol) const {
    std::vector<std::string> result;
    for (const auto& [name, members] : correlation_groups) {
        for (const auto& member : members) {
            if (member == symbol) {
                result.push_back(name);
                break;
            }
        }
    }
    return result;
}

bool LoggingConfig::validate() const {
    if (level() == spdlog::level::off && log_level != "off") {
        spdlog::error("unknown log_level '{}'", log_level);
        return false;
    }

    if (log_to_file) {
        if (log_file.empty()) {
            spdlog::error("log_file must be set when log_to_file is on");
            return false;
        }
        if (max_log_file_size_mb <= 0 || max_log_files <= 0) {
            spdlog::error("max_log_file_size_mb and max_log_files must be positive");
            return false;
        }
    }

    return true;
}

std::string LoggingConfig::log_file_path() const {
    return (std::filesystem::path(log_dir) / log_file).string();
}

spdlog::level::level_enum LoggingConfig::level() const {
    return spdlog::level::from_str(log_level);
}

void to_json(nlohmann::json& j, const RiskEnvelope& c) {
    j = nlohmann::json{
        {"max_risk_per_trade", c.max_risk_per_trade},
        {"max_account_exposure", c.max_account_exposure},
        {"max_symbol_exposure", c.max_symbol_exposure},
        {"min_liquidation_buffer", c.min_liquidation_buffer},
        {"critical_liquidation_buffer", c.critical_liquidation_buffer},
        {"max_effective_leverage", c.max_effective_leverage},
        {"maintenance_margin_rate", c.maintenance_margin_rate},
        {"max_correlated_exposure", c.max_correlated_exposure},
        {"correlated_hard_ceiling", c.correlated_hard_ceiling},
        {"min_free_margin_pct", c.min_free_margin_pct},
        {"correlation_groups", c.correlation_groups},
        {"default_reduce_fraction", c.default_reduce_fraction},
        {"quantity_step", c.quantity_step},
        {"min_order_quantity", c.min_order_quantity}
    };
}

void from_json(const nlohmann::json& j, RiskEnvelope& c) {
    if (j.contains("max_risk_per_trade")) j.at("max_risk_per_trade").get_to(c.max_risk_per_trade);
    if (j.contains("max_account_exposure")) j.at("max_account_exposure").get_to(c.max_account_exposure);
    if (j.contains("max_symbol_exposure")) j.at("max_symbol_exposure").get_to(c.max_symbol_exposure);
    if (j.contains("min_liquidation_buffer")) j.at("min_liquidation_buffer").get_to(c.min_liquidation_buffer);
    if (j.contains("critical_liquidation_buffer")) j.at("critical_liquidation_buffer").get_to(c.critical_liquidation_buffer);
    if (j.contains("max_effective_leverage")) j.at("max_effective_leverage").get_to(c.max_effective_leverage);
    if (j.contains("maintenance_margin_rate")) j.at("maintenance_margin_rate").get_to(c.maintenance_margin_rate);
    if (j.contains("max_correlated_exposure")) j.at("max_correlated_exposure").get_to(c.max_correlated_exposure);
    if (j.contains("correlated_hard_ceiling")) j.at("correlated_hard_ceiling").get_to(c.correlated_hard_ceiling);
    if (j.contains("min_free_margin_pct")) j.at("min_free_margin_pct").get_to(c.min_free_margin_pct);
    if (j.contains("correlation_groups")) j.at("correlation_groups").get_to(c.correlation_groups);
    if (j.contains("default_reduce_fraction")) j.at("default_reduce_fraction").get_to(c.default_reduce_fraction);
    if (j.contains("quantity_step")) j.at("quantity_step").get_to(c.quantity_step);
    if (j.contains("min_order_quantity")) j.at("min_order_quantity").get_to(c.min_order_quantity);
}

void to_json(nlohmann::json& j, const IntegrityConfig& c) {
    j = nlohmann::json{
        {"required_primitives", c.required_primitives},
        {"max_snapshot_age_ms", c.max_snapshot_age_ms},
        {"forbidden_terms", c.forbidden_terms}
    };
}

void from_json(const nlohmann::json& j, IntegrityConfig& c) {
    if (j.contains("required_primitives")) j.at("required_primitives").get_to(c.required_primitives);
    if (j.contains("max_snapshot_age_ms")) j.at("max_snapshot_age_ms").get_to(c.max_snapshot_age_ms);
    if (j.contains("forbidden_terms")) j.at("forbidden_terms").get_to(c.forbidden_terms);
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"parallel_symbols", c.parallel_symbols},
        {"halt_history_limit", c.halt_history_limit}
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    if (j.contains("parallel_symbols")) j.at("parallel_symbols").get_to(c.parallel_symbols);
    if (j.contains("halt_history_limit")) j.at("halt_history_limit").get_to(c.halt_history_limit);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_file", c.log_file},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_file")) j.at("log_file").get_to(c.log_file);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const AuditConfig& c) {
    j = nlohmann::json{
        {"journal_path", c.journal_path},
        {"positions_db_path", c.positions_db_path}
    };
}

void from_json(const nlohmann::json& j, AuditConfig& c) {
    if (j.contains("journal_path")) j.at("journal_path").get_to(c.journal_path);
    if (j.contains("positions_db_path")) j.at("positions_db_path").get_to(c.positions_db_path);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"risk", c.risk},
        {"integrity", c.integrity},
        {"engine", c.engine},
        {"logging", c.logging},
        {"audit", c.audit}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("risk")) j.at("risk").get_to(c.risk);
    if (j.contains("integrity")) j.at("integrity").get_to(c.integrity);
    if (j.contains("engine")) j.at("engine").get_to(c.engine);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("audit")) j.at("audit").get_to(c.audit);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw ConfigError("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (!risk.validate()) {
        return false;
    }

    if (integrity.max_snapshot_age_ms <= 0) {
        spdlog::error("max_snapshot_age_ms must be positive");
        return false;
    }

    for (const auto& name : integrity.required_primitives) {
        if (name.empty()) {
            spdlog::error("required_primitives must not contain empty names");
            return false;
        }
    }

    if (engine.halt_history_limit <= 0) {
        spdlog::error("halt_history_limit must be positive");
        return false;
    }

    if (!logging.validate()) {
        return false;
    }

    if (audit.journal_path.empty()) {
        spdlog::warn("audit.journal_path is empty, cycle results will not be journaled");
    }

    return true;
}

} // namespace gate
