#include <gtest/gtest.h>
#include "persistence/position_repository.hpp"
#include "position/execution_ledger.hpp"
#include <filesystem>
#include <sqlite3.h>

using namespace gate;

class PositionRepositoryTest : public ::testing::Test {
protected:
    std::string test_db_path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_db_path_ = "/tmp/test_positions_" + std::string(info->name()) + "_" +
                        std::to_string(now_ms()) + ".db";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }

    Position sample(const std::string& symbol, PositionState state = PositionState::OPEN) {
        Position p = Position::flat(symbol);
        p.state = state;
        p.direction = Direction::SHORT;
        p.size = 2.5;
        p.entry_price = 2000.0;
        p.stop_price = 2100.0;
        p.risk_reserved = 250.0;
        p.liquidation_distance = 0.2;
        p.last_update_cycle = 17;
        return p;
    }
};

TEST_F(PositionRepositoryTest, OpensDatabase) {
    PositionRepository repo(test_db_path_);
    EXPECT_TRUE(repo.is_open());
    EXPECT_TRUE(repo.load_non_flat().empty());
}

TEST_F(PositionRepositoryTest, SaveAndLoadPosition) {
    PositionRepository repo(test_db_path_);
    repo.save(sample("ETHUSDT"));

    auto loaded = repo.load("ETHUSDT");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->state, PositionState::OPEN);
    EXPECT_EQ(loaded->direction, Direction::SHORT);
    EXPECT_DOUBLE_EQ(loaded->size, 2.5);
    EXPECT_DOUBLE_EQ(loaded->entry_price, 2000.0);
    EXPECT_DOUBLE_EQ(loaded->stop_price, 2100.0);
    EXPECT_DOUBLE_EQ(loaded->risk_reserved, 250.0);
    EXPECT_DOUBLE_EQ(loaded->liquidation_distance, 0.2);
    EXPECT_EQ(loaded->last_update_cycle, 17u);
}

TEST_F(PositionRepositoryTest, LoadMissingReturnsNullopt) {
    PositionRepository repo(test_db_path_);
    EXPECT_FALSE(repo.load("NOPE").has_value());
}

TEST_F(PositionRepositoryTest, SaveOverwritesBySymbol) {
    PositionRepository repo(test_db_path_);
    repo.save(sample("ETHUSDT"));

    Position updated = sample("ETHUSDT", PositionState::REDUCING);
    updated.size = 1.0;
    repo.save(updated);

    auto all = repo.load_non_flat();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].state, PositionState::REDUCING);
    EXPECT_DOUBLE_EQ(all[0].size, 1.0);
}

TEST_F(PositionRepositoryTest, LoadNonFlatOrderedBySymbol) {
    PositionRepository repo(test_db_path_);
    repo.save(sample("SOLUSDT"));
    repo.save(sample("BTCUSDT", PositionState::FAILED));
    repo.save(sample("ETHUSDT"));

    auto all = repo.load_non_flat();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].symbol, "BTCUSDT");
    EXPECT_EQ(all[0].state, PositionState::FAILED);
    EXPECT_EQ(all[1].symbol, "ETHUSDT");
    EXPECT_EQ(all[2].symbol, "SOLUSDT");
}

TEST_F(PositionRepositoryTest, RemoveDeletesRow) {
    PositionRepository repo(test_db_path_);
    repo.save(sample("ETHUSDT"));
    repo.remove("ETHUSDT");
    EXPECT_FALSE(repo.load("ETHUSDT").has_value());
}

TEST_F(PositionRepositoryTest, LedgerRestoresAfterRestart) {
    {
        PositionRepository repo(test_db_path_);
        AccountSnapshot account;
        account.equity = 10000.0;
        ExecutionLedger ledger(account, &repo);

        ExecutionReport fill;
        fill.symbol = "BTCUSDT";
        fill.action = IntentAction::OPEN;
        fill.status = ReportStatus::FILLED;
        fill.direction = Direction::LONG;
        fill.filled_quantity = 3.0;
        fill.fill_price = 100.0;
        fill.stop_price = 90.0;
        fill.cycle = 2;
        ASSERT_FALSE(ledger.on_execution_confirmed(fill).violation);
    }

    PositionRepository repo(test_db_path_);
    ExecutionLedger restored(AccountSnapshot{}, &repo);

    auto pos = restored.position("BTCUSDT");
    EXPECT_EQ(pos.state, PositionState::OPEN);
    EXPECT_DOUBLE_EQ(pos.size, 3.0);
    EXPECT_DOUBLE_EQ(pos.stop_price, 90.0);
    EXPECT_EQ(pos.last_update_cycle, 2u);
}

TEST_F(PositionRepositoryTest, LedgerRemovesRowWhenFlat) {
    PositionRepository repo(test_db_path_);
    ExecutionLedger ledger(AccountSnapshot{}, &repo);

    ExecutionReport fill;
    fill.symbol = "BTCUSDT";
    fill.action = IntentAction::OPEN;
    fill.status = ReportStatus::FILLED;
    fill.direction = Direction::LONG;
    fill.filled_quantity = 3.0;
    fill.fill_price = 100.0;
    ledger.on_execution_confirmed(fill);
    ASSERT_TRUE(repo.load("BTCUSDT").has_value());

    ExecutionReport close = fill;
    close.action = IntentAction::CLOSE;
    ledger.on_execution_confirmed(close);
    EXPECT_FALSE(repo.load("BTCUSDT").has_value());
}

TEST_F(PositionRepositoryTest, LedgerUnchangedWhenStoreFails) {
    PositionRepository repo(test_db_path_);
    AccountSnapshot account;
    account.equity = 10000.0;
    account.margin_available = 10000.0;
    ExecutionLedger ledger(account, &repo);

    // Pull the table out from under the repository
    sqlite3* other = nullptr;
    ASSERT_EQ(sqlite3_open(test_db_path_.c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "DROP TABLE positions;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(other);

    ExecutionReport fill;
    fill.symbol = "BTCUSDT";
    fill.action = IntentAction::OPEN;
    fill.status = ReportStatus::FILLED;
    fill.direction = Direction::LONG;
    fill.filled_quantity = 3.0;
    fill.fill_price = 100.0;
    fill.stop_price = 90.0;
    fill.fee = 1.5;
    fill.cycle = 2;
    EXPECT_THROW(ledger.on_execution_confirmed(fill), std::runtime_error);

    EXPECT_EQ(ledger.position("BTCUSDT").state, PositionState::FLAT);
    EXPECT_TRUE(ledger.snapshot().positions.empty());
    EXPECT_DOUBLE_EQ(ledger.account().equity, 10000.0);
    EXPECT_DOUBLE_EQ(ledger.account().fees_paid, 0.0);
    EXPECT_EQ(ledger.account().sequence, 0u);
}
