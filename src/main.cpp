#include <iostream>
#include <fstream>
#include <filesystem>
#include <memory>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/errors.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/cycle_engine.hpp"
#include "core/halt_controller.hpp"
#include "persistence/audit_journal.hpp"
#include "persistence/json_codec.hpp"
#include "persistence/position_repository.hpp"
#include "position/execution_ledger.hpp"

using namespace gate;

// Diagnostics go to stderr and the rotating file; stdout is reserved for cycle results
void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%H:%M:%S.%e %^%-5l%$ [%t] %v");
        sinks.push_back(console);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file_path(),
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files));
        std::string pattern = config.json_format
            ? R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":"%v"})"
            : "%Y-%m-%dT%H:%M:%S.%eZ %-5l [%t] %v";
        file->set_formatter(std::make_unique<spdlog::pattern_formatter>(pattern, spdlog::pattern_time_type::utc));
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("gate", sinks.begin(), sinks.end());
    logger->set_level(config.level());
    // warn and above are flushed immediately
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

// Markets may be given as an array of snapshots or an object keyed by symbol
std::map<std::string, MarketSnapshot> parse_markets(const nlohmann::json& j) {
    std::map<std::string, MarketSnapshot> markets;
    if (j.is_array()) {
        for (const auto& item : j) {
            MarketSnapshot s = item.get<MarketSnapshot>();
            markets[s.symbol] = s;
        }
    } else if (j.is_object()) {
        for (const auto& [symbol, item] : j.items()) {
            MarketSnapshot s = item.get<MarketSnapshot>();
            if (s.symbol.empty()) s.symbol = symbol;
            markets[symbol] = s;
        }
    }
    return markets;
}

struct ReplayStats {
    size_t cycles{0};
    size_t intents{0};
    size_t verified{0};
    size_t mismatches{0};
};

/**
 * One input line:
 *   cycle, account?, positions?, markets, mandates, feed_integrity_lost?,
 *   halt?, halt_reset?, reconcile?, submit_intents?, reports?
 * Operator actions run first, then seeding, the cycle, and finally the
 * execution reports through the confirmed-execution callback.
 */
void process_line(const nlohmann::json& line,
                  CycleEngine& engine,
                  ExecutionLedger& ledger,
                  HaltController& halt,
                  AuditJournal* journal,
                  const std::map<std::string, std::string>& expected,
                  ReplayStats& stats) {
    CycleInput input;
    input.cycle = line.value("cycle", static_cast<uint64_t>(stats.cycles + 1));

    if (line.contains("halt_reset")) {
        std::string note = line.at("halt_reset").get<std::string>();
        HaltReason previous = halt.reason();
        if (halt.reset(note) && journal) {
            HaltEvent event;
            event.timestamp = wall_now();
            event.cycle = input.cycle;
            event.reason = previous;
            event.details = note;
            event.is_activation = false;
            journal->record_halt(event);
        }
    }

    if (line.contains("reconcile")) {
        for (const auto& item : line.at("reconcile")) {
            auto update = ledger.reconcile_failed(item.value("symbol", ""), item.value("note", ""));
            if (update.violation) {
                spdlog::warn("Cycle {}: reconcile refused: {}", input.cycle, update.detail);
            }
        }
    }

    if (line.contains("halt")) {
        if (halt.activate_manual(line.at("halt").get<std::string>(), input.cycle) && journal) {
            HaltEvent event;
            event.timestamp = wall_now();
            event.cycle = input.cycle;
            event.reason = halt.reason();
            event.details = halt.details();
            journal->record_halt(event);
        }
    }

    if (line.contains("account")) {
        ledger.set_account(line.at("account").get<AccountSnapshot>());
    }
    if (line.contains("positions")) {
        for (const auto& item : line.at("positions")) {
            ledger.restore(item.get<Position>());
        }
    }

    if (line.contains("markets")) {
        input.markets = parse_markets(line.at("markets"));
    }
    if (line.contains("mandates")) {
        input.mandates = line.at("mandates").get<std::vector<Mandate>>();
    }
    input.feed_integrity_lost = line.value("feed_integrity_lost", false);

    CycleReport report = engine.run_cycle(input);
    stats.cycles++;

    nlohmann::json out;
    out["cycle"] = report.cycle;
    out["halted"] = report.halted;
    out["halt_reason"] = halt_reason_to_string(report.halt_reason);
    out["intents"] = nlohmann::json::array();

    for (const auto& outcome : report.outcomes) {
        if (outcome.intent) {
            out["intents"].push_back(*outcome.intent);
            stats.intents++;
        }

        if (expected.empty()) continue;
        std::string key = AuditJournal::record_key(report.cycle, outcome.arbitration.symbol);
        std::string actual = outcome.fingerprint.empty() ? AuditJournal::fingerprint(outcome)
                                                         : outcome.fingerprint;
        auto it = expected.find(key);
        if (it == expected.end() || it->second != actual) {
            stats.mismatches++;
            spdlog::error("Fingerprint mismatch at {}: expected {} got {}", key,
                          it == expected.end() ? "<missing>" : it->second, actual);
        } else {
            stats.verified++;
        }
    }
    std::cout << out.dump() << std::endl;

    if (line.value("submit_intents", false)) {
        for (const auto& intent : report.intents()) {
            ledger.on_intent_submitted(intent, report.cycle);
        }
    }

    if (line.contains("reports")) {
        for (const auto& item : line.at("reports")) {
            ExecutionReport r = item.get<ExecutionReport>();
            if (r.cycle == 0) r.cycle = report.cycle;
            engine.on_execution_confirmed(r);
        }
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"mandate_gate - Deterministic mandate arbitration over recorded cycles"};

    std::string config_path = "configs/gate.json";
    std::string input_file;
    std::string audit_path;
    std::string verify_path;
    std::string log_level;
    bool parallel = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-i,--input", input_file, "JSON-lines file with one cycle per line")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-a,--audit", audit_path, "Audit journal output (overrides config)");
    app.add_option("--verify", verify_path, "Compare fingerprints against a previous journal")
        ->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", log_level, "Override logging.log_level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_flag("-p,--parallel", parallel, "Evaluate symbols concurrently");

    CLI11_PARSE(app, argc, argv);

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else {
            std::cerr << "Config " << config_path << " not found, using defaults\n";
        }
    } catch (const ConfigError& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (!log_level.empty()) config.logging.log_level = log_level;
    if (!audit_path.empty()) config.audit.journal_path = audit_path;
    if (parallel) config.engine.parallel_symbols = true;

    if (!config.logging.validate()) {
        std::cerr << "Invalid logging configuration\n";
        return 1;
    }
    setup_logging(config.logging);

    std::map<std::string, std::string> expected;
    if (!verify_path.empty()) {
        expected = AuditJournal::read_fingerprints(verify_path);
        spdlog::info("Loaded {} reference fingerprints from {}", expected.size(), verify_path);
    }

    try {
        std::unique_ptr<PositionRepository> repository;
        if (!config.audit.positions_db_path.empty()) {
            repository = std::make_unique<PositionRepository>(config.audit.positions_db_path);
        }

        std::unique_ptr<AuditJournal> journal;
        if (!config.audit.journal_path.empty()) {
            journal = std::make_unique<AuditJournal>(config.audit.journal_path);
            if (!journal->is_open()) {
                spdlog::error("Audit journal unavailable: {}", config.audit.journal_path);
                return 1;
            }
        }

        ExecutionLedger ledger(AccountSnapshot{}, repository.get());
        HaltController halt(static_cast<size_t>(config.engine.halt_history_limit));
        CycleEngine engine(config, ledger, halt, journal.get());

        std::ifstream in(input_file);
        std::string text;
        size_t line_no = 0;
        ReplayStats stats;

        while (std::getline(in, text)) {
            ++line_no;
            if (text.empty()) continue;
            try {
                process_line(nlohmann::json::parse(text), engine, ledger, halt,
                             journal.get(), expected, stats);
            } catch (const nlohmann::json::exception& e) {
                spdlog::error("{}:{}: malformed cycle input: {}", input_file, line_no, e.what());
                return 1;
            } catch (const DataIntegrityFailure& e) {
                spdlog::error("{}:{}: {}", input_file, line_no, e.what());
                return 1;
            }
        }

        spdlog::info("Replay complete: cycles={} intents={} halted={}",
                     stats.cycles, stats.intents, halt.is_halted());

        if (!expected.empty()) {
            spdlog::info("Verification: {} matched, {} mismatched", stats.verified, stats.mismatches);
            if (stats.mismatches > 0) return 1;
        }
    } catch (const std::runtime_error& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
