#include "persistence/audit_journal.hpp"
#include "persistence/json_codec.hpp"
#include "utils/crypto.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace gate {

AuditJournal::AuditJournal(const std::string& path)
    : path_(path)
{
    open_file();
}

AuditJournal::~AuditJournal() {
    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void AuditJournal::open_file() {
    // Create directory if needed
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open audit journal: {}", path_);
    } else {
        spdlog::info("Audit journal opened: {}", path_);
    }
}

bool AuditJournal::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void AuditJournal::write_line(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << j.dump() << "\n";
    }
}

std::string AuditJournal::record_key(uint64_t cycle, const std::string& symbol) {
    return std::to_string(cycle) + ":" + symbol;
}

std::string AuditJournal::fingerprint(const SymbolOutcome& outcome) {
    nlohmann::json data = outcome;
    return crypto::sha256(data.dump());
}

std::string AuditJournal::record_outcome(uint64_t cycle, const SymbolOutcome& outcome) {
    nlohmann::json data = outcome;
    std::string digest = crypto::sha256(data.dump());

    nlohmann::json j;
    j["event_type"] = "cycle_result";
    j["timestamp"] = time_utils::now_iso8601();
    j["cycle"] = cycle;
    j["symbol"] = outcome.arbitration.symbol;
    j["fingerprint"] = digest;
    j["data"] = std::move(data);
    write_line(j);

    return digest;
}

void AuditJournal::record_halt(const HaltEvent& event) {
    nlohmann::json data{
        {"cycle", event.cycle},
        {"reason", halt_reason_to_string(event.reason)},
        {"details", event.details},
        {"is_activation", event.is_activation},
        {"event_time", time_utils::to_iso8601(event.timestamp)}
    };
    record_event("halt", data);
}

void AuditJournal::record_event(const std::string& event_type, const nlohmann::json& data) {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = data;
    write_line(j);
}

void AuditJournal::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

std::vector<nlohmann::json> AuditJournal::read_records(const std::string& path) {
    std::vector<nlohmann::json> records;

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Audit journal not readable: {}", path);
        return records;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            records.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("Skipping malformed journal line {} in {}: {}", line_no, path, e.what());
        }
    }

    return records;
}

std::map<std::string, std::string> AuditJournal::read_fingerprints(const std::string& path) {
    std::map<std::string, std::string> result;
    for (const auto& j : read_records(path)) {
        if (j.value("event_type", "") != "cycle_result") continue;
        result[record_key(j.value("cycle", uint64_t{0}), j.value("symbol", ""))] =
            j.value("fingerprint", "");
    }
    return result;
}

} // namespace gate
