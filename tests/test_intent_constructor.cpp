#include <gtest/gtest.h>
#include "execution/intent_constructor.hpp"
#include "risk/portfolio_facts.hpp"

using namespace gate;

class IntentConstructorTest : public ::testing::Test {
protected:
    Position open_long(Size size, Price entry = 100.0, Price stop = 95.0) {
        Position p = Position::flat("BTCUSDT");
        p.state = PositionState::OPEN;
        p.direction = Direction::LONG;
        p.size = size;
        p.entry_price = entry;
        p.stop_price = stop;
        return p;
    }

    EvaluationInput make_input(const Position& position, Price mark = 100.0) {
        EvaluationInput input;
        input.position = position;
        input.account.equity = 10000.0;
        input.account.margin_available = 10000.0;
        input.market.symbol = position.symbol;
        input.market.mark_price = mark;

        std::map<std::string, Position> positions;
        if (position.holds_size()) positions[position.symbol] = position;
        input.portfolio = compute_portfolio_facts(positions, {{position.symbol, mark}}, input.account, envelope_);
        return input;
    }

    std::optional<ExecutionIntent> construct(const Mandate& m, const EvaluationInput& input) {
        InvariantEvaluator evaluator(envelope_);
        IntentConstructor constructor(evaluator);
        return constructor.construct(m, input);
    }

    Mandate enter(Price stop) {
        Mandate m = make_mandate(MandateType::ENTER, "BTCUSDT", Direction::LONG, "enter-1");
        m.scope.stop_price = stop;
        return m;
    }

    RiskEnvelope envelope_;
};

// ============================================================================
// ENTER / ADD
// ============================================================================

TEST_F(IntentConstructorTest, Construct_EnterSizedByRiskBudget) {
    auto intent = construct(enter(95.0), make_input(Position::flat("BTCUSDT")));

    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->action, IntentAction::OPEN);
    EXPECT_EQ(intent->direction, Direction::LONG);
    EXPECT_NEAR(intent->quantity, 20.0, 1e-9);
    EXPECT_EQ(intent->price_type, PriceType::MARKET);
    EXPECT_DOUBLE_EQ(intent->stop_price, 95.0);
    EXPECT_EQ(intent->mandate_type, MandateType::ENTER);
    EXPECT_EQ(intent->trigger_id, "enter-1");
}

TEST_F(IntentConstructorTest, Construct_EnterSuppressedWithoutFreeMargin) {
    auto input = make_input(Position::flat("BTCUSDT"));
    input.account.margin_available = 0.0;
    EXPECT_FALSE(construct(enter(95.0), input).has_value());
}

TEST_F(IntentConstructorTest, Construct_RequestOnlyShrinks) {
    Mandate small = enter(95.0);
    small.scope.quantity = 5.0;
    auto intent = construct(small, make_input(Position::flat("BTCUSDT")));
    ASSERT_TRUE(intent.has_value());
    EXPECT_DOUBLE_EQ(intent->quantity, 5.0);

    Mandate large = enter(95.0);
    large.scope.quantity = 50.0;
    intent = construct(large, make_input(Position::flat("BTCUSDT")));
    ASSERT_TRUE(intent.has_value());
    EXPECT_NEAR(intent->quantity, 20.0, 1e-9);
}

TEST_F(IntentConstructorTest, Construct_LimitEntry) {
    Mandate m = enter(94.0);
    m.scope.limit_price = 99.0;

    auto intent = construct(m, make_input(Position::flat("BTCUSDT")));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->price_type, PriceType::LIMIT);
    EXPECT_DOUBLE_EQ(intent->limit_price, 99.0);
    // 100 / |99 - 94|
    EXPECT_NEAR(intent->quantity, 20.0, 1e-9);
}

TEST_F(IntentConstructorTest, Construct_StopEntry) {
    Mandate m = enter(96.0);
    m.scope.entry_trigger_price = 101.0;

    auto intent = construct(m, make_input(Position::flat("BTCUSDT")));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->price_type, PriceType::STOP);
    EXPECT_DOUBLE_EQ(intent->limit_price, 101.0);
}

TEST_F(IntentConstructorTest, Construct_RoundsDownToStep) {
    envelope_.quantity_step = 0.3;
    auto intent = construct(enter(95.0), make_input(Position::flat("BTCUSDT")));
    ASSERT_TRUE(intent.has_value());
    EXPECT_NEAR(intent->quantity, 19.8, 1e-9);
}

TEST_F(IntentConstructorTest, Construct_SuppressedBelowMinimumOrder) {
    envelope_.min_order_quantity = 25.0;
    EXPECT_FALSE(construct(enter(95.0), make_input(Position::flat("BTCUSDT"))).has_value());
}

TEST_F(IntentConstructorTest, Construct_EnterWithoutStopSuppressed) {
    Mandate m = make_mandate(MandateType::ENTER, "BTCUSDT", Direction::LONG, "enter-1");
    EXPECT_FALSE(construct(m, make_input(Position::flat("BTCUSDT"))).has_value());
}

TEST_F(IntentConstructorTest, Construct_AddKeepsTighterStop) {
    auto input = make_input(open_long(10.0), 102.0);

    Mandate tighter = make_mandate(MandateType::ADD, "BTCUSDT", Direction::LONG, "add-1");
    tighter.scope.stop_price = 97.0;
    auto intent = construct(tighter, input);
    ASSERT_TRUE(intent.has_value());
    EXPECT_DOUBLE_EQ(intent->stop_price, 97.0);
    EXPECT_NEAR(intent->quantity, 20.0, 1e-9);
    EXPECT_EQ(intent->mandate_type, MandateType::ADD);

    Mandate looser = tighter;
    looser.scope.stop_price = 90.0;
    intent = construct(looser, input);
    ASSERT_TRUE(intent.has_value());
    EXPECT_DOUBLE_EQ(intent->stop_price, 95.0);
}

// ============================================================================
// REDUCE
// ============================================================================

TEST_F(IntentConstructorTest, Construct_StrategyReduceByFraction) {
    Mandate m = make_mandate(MandateType::REDUCE, "BTCUSDT", Direction::NONE, "reduce-1");
    m.scope.reduce_fraction = 0.5;

    auto intent = construct(m, make_input(open_long(10.0)));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->action, IntentAction::REDUCE);
    EXPECT_EQ(intent->direction, Direction::LONG);
    EXPECT_DOUBLE_EQ(intent->quantity, 5.0);
    EXPECT_EQ(intent->price_type, PriceType::MARKET);
}

TEST_F(IntentConstructorTest, Construct_ReduceNeverClosesWholePosition) {
    Mandate m = make_mandate(MandateType::REDUCE, "BTCUSDT", Direction::NONE, "reduce-1");
    m.scope.quantity = 10.0;
    EXPECT_FALSE(construct(m, make_input(open_long(10.0))).has_value());
}

TEST_F(IntentConstructorTest, Construct_StrategyReduceRaisedToRestoringMinimum) {
    Mandate m = make_mandate(MandateType::REDUCE, "BTCUSDT", Direction::NONE, "reduce-1");
    m.scope.reduce_fraction = 0.1;

    auto intent = construct(m, make_input(open_long(800.0)));
    ASSERT_TRUE(intent.has_value());
    EXPECT_NEAR(intent->quantity, 300.0, 1e-9);
}

TEST_F(IntentConstructorTest, Construct_ForcedReduceUsesScopedQuantity) {
    Mandate forced = make_forced(MandateType::REDUCE, "BTCUSDT", Direction::LONG, 3, 300.0);

    auto intent = construct(forced, make_input(open_long(800.0)));
    ASSERT_TRUE(intent.has_value());
    EXPECT_DOUBLE_EQ(intent->quantity, 300.0);
    EXPECT_EQ(intent->trigger_id, "force:REDUCE:BTCUSDT:3");
}

// ============================================================================
// EXIT
// ============================================================================

TEST_F(IntentConstructorTest, Construct_ExitClosesFullSize) {
    Mandate exit = make_mandate(MandateType::EXIT, "BTCUSDT", Direction::NONE, "exit-1");

    auto intent = construct(exit, make_input(open_long(10.0)));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->action, IntentAction::CLOSE);
    EXPECT_DOUBLE_EQ(intent->quantity, 10.0);
    EXPECT_EQ(intent->direction, Direction::LONG);
}

TEST_F(IntentConstructorTest, Construct_ExitWhileEnteringCancels) {
    Position entering = Position::flat("BTCUSDT");
    entering.state = PositionState::ENTERING;
    entering.direction = Direction::LONG;

    Mandate exit = make_mandate(MandateType::EXIT, "BTCUSDT", Direction::NONE, "exit-1");
    auto intent = construct(exit, make_input(entering));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->action, IntentAction::CLOSE);
    EXPECT_DOUBLE_EQ(intent->quantity, 0.0);
}

TEST_F(IntentConstructorTest, Construct_NothingForFlatOrHold) {
    Mandate exit = make_mandate(MandateType::EXIT, "BTCUSDT", Direction::NONE, "exit-1");
    EXPECT_FALSE(construct(exit, make_input(Position::flat("BTCUSDT"))).has_value());

    Mandate hold = make_mandate(MandateType::HOLD, "BTCUSDT", Direction::NONE, "hold-1");
    EXPECT_FALSE(construct(hold, make_input(open_long(10.0))).has_value());

    Mandate block = make_mandate(MandateType::BLOCK, "BTCUSDT", Direction::NONE, "block-1");
    EXPECT_FALSE(construct(block, make_input(open_long(10.0))).has_value());
}
