#include "persistence/position_repository.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace gate {

PositionRepository::PositionRepository(const std::string& db_path)
    : db_path_(db_path)
{
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    execute("PRAGMA journal_mode = WAL;");
    execute(R"(
        CREATE TABLE IF NOT EXISTS positions (
            symbol TEXT PRIMARY KEY,
            direction TEXT NOT NULL,
            size REAL NOT NULL,
            entry_price REAL NOT NULL,
            stop_price REAL NOT NULL,
            state TEXT NOT NULL,
            risk_reserved REAL NOT NULL,
            liquidation_distance REAL NOT NULL,
            last_update_cycle INTEGER NOT NULL
        );
    )");

    spdlog::info("PositionRepository opened: {}", db_path);
}

PositionRepository::~PositionRepository() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void PositionRepository::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

sqlite3_stmt* PositionRepository::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void PositionRepository::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

void PositionRepository::save(const Position& position) {
    auto stmt = prepare(R"(
        INSERT INTO positions (
            symbol, direction, size, entry_price, stop_price, state,
            risk_reserved, liquidation_distance, last_update_cycle
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(symbol) DO UPDATE SET
            direction = excluded.direction,
            size = excluded.size,
            entry_price = excluded.entry_price,
            stop_price = excluded.stop_price,
            state = excluded.state,
            risk_reserved = excluded.risk_reserved,
            liquidation_distance = excluded.liquidation_distance,
            last_update_cycle = excluded.last_update_cycle;
    )");

    std::string direction = direction_to_string(position.direction);
    std::string state = position_state_to_string(position.state);

    sqlite3_bind_text(stmt, 1, position.symbol.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, direction.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, position.size);
    sqlite3_bind_double(stmt, 4, position.entry_price);
    sqlite3_bind_double(stmt, 5, position.stop_price);
    sqlite3_bind_text(stmt, 6, state.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 7, position.risk_reserved);
    sqlite3_bind_double(stmt, 8, position.liquidation_distance);
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(position.last_update_cycle));

    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to save position " + position.symbol + ": " +
                                 std::string(sqlite3_errmsg(db_)));
    }
}

Position PositionRepository::read_row(sqlite3_stmt* stmt) {
    auto text = [stmt](int col) {
        const unsigned char* t = sqlite3_column_text(stmt, col);
        return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
    };

    Position p;
    p.symbol = text(0);
    p.direction = direction_from_string(text(1)).value_or(Direction::NONE);
    p.size = sqlite3_column_double(stmt, 2);
    p.entry_price = sqlite3_column_double(stmt, 3);
    p.stop_price = sqlite3_column_double(stmt, 4);

    auto state = position_state_from_string(text(5));
    if (!state) {
        throw std::runtime_error("Unknown position state '" + text(5) + "' for " + p.symbol);
    }
    p.state = *state;

    p.risk_reserved = sqlite3_column_double(stmt, 6);
    p.liquidation_distance = sqlite3_column_double(stmt, 7);
    p.last_update_cycle = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
    return p;
}

std::optional<Position> PositionRepository::load(const std::string& symbol) {
    auto stmt = prepare(
        "SELECT symbol, direction, size, entry_price, stop_price, state, "
        "risk_reserved, liquidation_distance, last_update_cycle "
        "FROM positions WHERE symbol = ?;"
    );
    sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        finalize(stmt);
        return std::nullopt;
    }

    try {
        Position p = read_row(stmt);
        finalize(stmt);
        return p;
    } catch (const std::runtime_error&) {
        finalize(stmt);
        throw;
    }
}

std::vector<Position> PositionRepository::load_non_flat() {
    auto stmt = prepare(
        "SELECT symbol, direction, size, entry_price, stop_price, state, "
        "risk_reserved, liquidation_distance, last_update_cycle "
        "FROM positions WHERE state != 'FLAT' ORDER BY symbol;"
    );

    std::vector<Position> result;
    try {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            result.push_back(read_row(stmt));
        }
    } catch (const std::runtime_error&) {
        finalize(stmt);
        throw;
    }

    finalize(stmt);
    return result;
}

void PositionRepository::remove(const std::string& symbol) {
    auto stmt = prepare("DELETE FROM positions WHERE symbol = ?;");
    sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to remove position " + symbol + ": " +
                                 std::string(sqlite3_errmsg(db_)));
    }
}

} // namespace gate
