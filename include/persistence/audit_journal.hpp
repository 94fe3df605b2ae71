#pragma once

#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/cycle_report.hpp"
#include "core/halt_controller.hpp"

namespace gate {

/**
 * Append-only audit trail of every cycle decision.
 * Writes JSON lines: {"event_type", "timestamp", ..., "data"}.
 *
 * cycle_result records carry a SHA-256 fingerprint of the canonical outcome
 * JSON (sorted keys, no timestamp), so two runs over the same inputs can be
 * compared record by record.
 */
class AuditJournal {
public:
    explicit AuditJournal(const std::string& path);
    ~AuditJournal();

    AuditJournal(const AuditJournal&) = delete;
    AuditJournal& operator=(const AuditJournal&) = delete;

    bool is_open() const;
    const std::string& path() const { return path_; }

    // Returns the fingerprint written with the record
    std::string record_outcome(uint64_t cycle, const SymbolOutcome& outcome);
    void record_halt(const HaltEvent& event);

    // Generic event recording
    void record_event(const std::string& event_type, const nlohmann::json& data);

    void flush();

    static std::string fingerprint(const SymbolOutcome& outcome);

    // Malformed lines are skipped with a warning
    static std::vector<nlohmann::json> read_records(const std::string& path);

    // "<cycle>:<symbol>" -> fingerprint, cycle_result records only
    static std::map<std::string, std::string> read_fingerprints(const std::string& path);

    static std::string record_key(uint64_t cycle, const std::string& symbol);

private:
    std::string path_;
    std::ofstream file_;
    mutable std::mutex mutex_;

    void open_file();
    void write_line(const nlohmann::json& j);
};

} // namespace gate
