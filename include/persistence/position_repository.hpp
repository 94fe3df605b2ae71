#pragma once

#include <optional>
#include <string>
#include <vector>
#include "position/position.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace gate {

/**
 * SQLite store for non-FLAT positions, reloaded by the ledger on restart.
 * One row per symbol; a position returning to FLAT is removed.
 */
class PositionRepository {
public:
    explicit PositionRepository(const std::string& db_path);
    ~PositionRepository();

    // Non-copyable
    PositionRepository(const PositionRepository&) = delete;
    PositionRepository& operator=(const PositionRepository&) = delete;

    bool is_open() const { return db_ != nullptr; }

    void save(const Position& position);
    std::optional<Position> load(const std::string& symbol);
    std::vector<Position> load_non_flat();
    void remove(const std::string& symbol);

private:
    sqlite3* db_{nullptr};
    std::string db_path_;

    void execute(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);
    void finalize(sqlite3_stmt* stmt);
    Position read_row(sqlite3_stmt* stmt);
};

} // namespace gate
