#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "persistence/json_codec.hpp"

using namespace gate;

class JsonCodecTest : public ::testing::Test {};

TEST_F(JsonCodecTest, Mandate_ParsesProposal) {
    auto j = nlohmann::json::parse(R"({
        "type": "ENTER",
        "symbol": "BTCUSDT",
        "direction": "LONG",
        "preconditions": ["FLAT"],
        "scope": {"stop_price": 95.0, "limit_price": 99.5},
        "expiry_cycle": 12,
        "trigger_id": "breakout-7"
    })");

    Mandate m = j.get<Mandate>();
    EXPECT_EQ(m.type, MandateType::ENTER);
    EXPECT_EQ(m.direction, Direction::LONG);
    EXPECT_EQ(m.authority_rank, authority_of(MandateType::ENTER));
    ASSERT_EQ(m.preconditions.size(), 1u);
    EXPECT_EQ(m.preconditions[0], PositionState::FLAT);
    ASSERT_TRUE(m.scope.stop_price.has_value());
    EXPECT_DOUBLE_EQ(*m.scope.stop_price, 95.0);
    EXPECT_DOUBLE_EQ(*m.scope.limit_price, 99.5);
    EXPECT_FALSE(m.scope.quantity.has_value());
    EXPECT_EQ(*m.expiry_cycle, 12u);
    EXPECT_EQ(m.origin, MandateOrigin::STRATEGY);
}

TEST_F(JsonCodecTest, Mandate_ExplicitAuthorityIsKept) {
    auto j = nlohmann::json::parse(R"({"type": "HOLD", "symbol": "X", "authority_rank": 6, "trigger_id": "h"})");
    EXPECT_EQ(j.get<Mandate>().authority_rank, 6);
}

TEST_F(JsonCodecTest, Mandate_UnknownTypeThrows) {
    auto j = nlohmann::json::parse(R"({"type": "PYRAMID", "symbol": "BTCUSDT", "trigger_id": "x"})");
    EXPECT_THROW(j.get<Mandate>(), DataIntegrityFailure);
}

TEST_F(JsonCodecTest, Mandate_UnknownPreconditionThrows) {
    auto j = nlohmann::json::parse(R"({"type": "HOLD", "symbol": "BTCUSDT", "preconditions": ["LIMBO"]})");
    EXPECT_THROW(j.get<Mandate>(), DataIntegrityFailure);
}

TEST_F(JsonCodecTest, Mandate_ScopeWritesOnlySetFields) {
    Mandate m = make_mandate(MandateType::REDUCE, "BTCUSDT", Direction::NONE, "r-1");
    m.scope.reduce_fraction = 0.25;

    nlohmann::json j = m;
    EXPECT_TRUE(j["scope"].contains("reduce_fraction"));
    EXPECT_FALSE(j["scope"].contains("quantity"));
    EXPECT_FALSE(j.contains("expiry_cycle"));
    EXPECT_EQ(j["type"], "REDUCE");
}

TEST_F(JsonCodecTest, ExecutionReport_ParsesStatus) {
    auto j = nlohmann::json::parse(R"({
        "symbol": "ETHUSDT", "action": "REDUCE", "status": "FILLED",
        "filled_quantity": 1.5, "fill_price": 2010.0, "fee": 0.3
    })");

    auto r = j.get<ExecutionReport>();
    EXPECT_EQ(r.action, IntentAction::REDUCE);
    EXPECT_EQ(r.status, ReportStatus::FILLED);
    EXPECT_DOUBLE_EQ(r.filled_quantity, 1.5);
    EXPECT_EQ(r.cycle, 0u);

    j["status"] = "PARTIAL";
    EXPECT_THROW(j.get<ExecutionReport>(), DataIntegrityFailure);
}

TEST_F(JsonCodecTest, AccountSnapshot_MarginDefaultsToEquity) {
    auto a = nlohmann::json::parse(R"({"equity": 5000})").get<AccountSnapshot>();
    EXPECT_DOUBLE_EQ(a.equity, 5000.0);
    EXPECT_DOUBLE_EQ(a.margin_available, 5000.0);
}

TEST_F(JsonCodecTest, Position_ParsesState) {
    auto p = nlohmann::json::parse(R"({
        "symbol": "BTCUSDT", "state": "OPEN", "direction": "SHORT",
        "size": 2, "entry_price": 100, "stop_price": 104
    })").get<Position>();

    EXPECT_EQ(p.state, PositionState::OPEN);
    EXPECT_EQ(p.direction, Direction::SHORT);
    EXPECT_DOUBLE_EQ(p.liquidation_distance, 1.0);
}

TEST_F(JsonCodecTest, MarketSnapshot_ParsesPrimitives) {
    auto s = nlohmann::json::parse(R"({
        "symbol": "BTCUSDT", "mark_price": 100.5, "age_ms": 20,
        "primitives": {"spread_bps": 1.2}
    })").get<MarketSnapshot>();

    EXPECT_DOUBLE_EQ(s.mark_price, 100.5);
    EXPECT_DOUBLE_EQ(s.liquidation_price, 0.0);
    EXPECT_DOUBLE_EQ(s.primitives.at("spread_bps"), 1.2);
}

TEST_F(JsonCodecTest, SymbolOutcome_ExcludesFingerprint) {
    SymbolOutcome outcome;
    outcome.arbitration.symbol = "BTCUSDT";
    outcome.arbitration.cycle = 3;
    outcome.fingerprint = "abc";

    nlohmann::json j = outcome;
    EXPECT_FALSE(j.contains("fingerprint"));
    EXPECT_TRUE(j["intent"].is_null());
    EXPECT_TRUE(j["arbitration"]["selected"].is_null());
    EXPECT_EQ(j["arbitration"]["assessment"], "ALLOW");
}

TEST_F(JsonCodecTest, ExecutionIntent_RoundTrip) {
    ExecutionIntent intent;
    intent.symbol = "BTCUSDT";
    intent.action = IntentAction::OPEN;
    intent.direction = Direction::LONG;
    intent.quantity = 20.0;
    intent.price_type = PriceType::LIMIT;
    intent.limit_price = 99.0;
    intent.stop_price = 94.0;
    intent.mandate_type = MandateType::ENTER;
    intent.trigger_id = "enter-1";

    nlohmann::json j = intent;
    auto back = j.get<ExecutionIntent>();
    EXPECT_EQ(back.price_type, PriceType::LIMIT);
    EXPECT_EQ(back.mandate_type, MandateType::ENTER);
    EXPECT_DOUBLE_EQ(back.limit_price, 99.0);
    EXPECT_EQ(back.trigger_id, "enter-1");
}
