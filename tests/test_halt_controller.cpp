#include <gtest/gtest.h>
#include "core/halt_controller.hpp"

using namespace gate;

class HaltControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        halt_ = std::make_unique<HaltController>(10);
    }

    std::unique_ptr<HaltController> halt_;
};

TEST_F(HaltControllerTest, Activate_LatchesFirstReason) {
    EXPECT_FALSE(halt_->is_halted());
    EXPECT_EQ(halt_->reason(), HaltReason::NONE);

    EXPECT_TRUE(halt_->activate(HaltReason::DATA_INTEGRITY_LOSS, "feed gap", 3));
    EXPECT_TRUE(halt_->is_halted());

    EXPECT_FALSE(halt_->activate(HaltReason::MANUAL, "operator", 4));
    EXPECT_EQ(halt_->reason(), HaltReason::DATA_INTEGRITY_LOSS);
    EXPECT_EQ(halt_->details(), "feed gap");
}

TEST_F(HaltControllerTest, Reset_RequiresOperatorNote) {
    halt_->activate_manual("maintenance", 1);

    EXPECT_FALSE(halt_->reset(""));
    EXPECT_TRUE(halt_->is_halted());

    EXPECT_TRUE(halt_->reset("checked venue positions"));
    EXPECT_FALSE(halt_->is_halted());
    EXPECT_EQ(halt_->reason(), HaltReason::NONE);
}

TEST_F(HaltControllerTest, Reset_WhenNotHaltedFails) {
    EXPECT_FALSE(halt_->reset("nothing to do"));
}

TEST_F(HaltControllerTest, ActivateManual_DefaultDetails) {
    EXPECT_TRUE(halt_->activate_manual(""));
    EXPECT_EQ(halt_->reason(), HaltReason::MANUAL);
    EXPECT_FALSE(halt_->details().empty());
}

TEST_F(HaltControllerTest, CheckFailedPositions_HaltsOnFailed) {
    std::map<std::string, Position> positions;
    Position ok = Position::flat("ETHUSDT");
    ok.state = PositionState::OPEN;
    ok.direction = Direction::LONG;
    ok.size = 1.0;
    positions["ETHUSDT"] = ok;

    EXPECT_FALSE(halt_->check_failed_positions(positions, 1));
    EXPECT_FALSE(halt_->is_halted());

    Position failed = ok;
    failed.symbol = "BTCUSDT";
    failed.state = PositionState::FAILED;
    positions["BTCUSDT"] = failed;

    EXPECT_TRUE(halt_->check_failed_positions(positions, 2));
    EXPECT_EQ(halt_->reason(), HaltReason::FAILED_POSITION);
    EXPECT_NE(halt_->details().find("BTCUSDT"), std::string::npos);
}

TEST_F(HaltControllerTest, CheckFeedIntegrity_OnlyWhenLost) {
    EXPECT_FALSE(halt_->check_feed_integrity(false, 1));
    EXPECT_TRUE(halt_->check_feed_integrity(true, 2));
    EXPECT_EQ(halt_->reason(), HaltReason::DATA_INTEGRITY_LOSS);
}

TEST_F(HaltControllerTest, CheckCorrelatedBreach_UsesPortfolioFacts) {
    PortfolioFacts facts;
    facts.equity = 10000.0;
    EXPECT_FALSE(halt_->check_correlated_breach(facts, 1));

    facts.hard_ceiling_breached = true;
    facts.breached_group = "majors";
    facts.group_net_notional["majors"] = 90000.0;

    EXPECT_TRUE(halt_->check_correlated_breach(facts, 2));
    EXPECT_EQ(halt_->reason(), HaltReason::CORRELATED_BREACH);
    EXPECT_NE(halt_->details().find("majors"), std::string::npos);
}

TEST_F(HaltControllerTest, Checks_DoNothingWhileHalted) {
    halt_->activate_manual("maintenance");
    EXPECT_FALSE(halt_->check_feed_integrity(true, 1));
    EXPECT_EQ(halt_->reason(), HaltReason::MANUAL);
}

TEST_F(HaltControllerTest, Callback_InvokedOnActivation) {
    HaltReason seen = HaltReason::NONE;
    std::string seen_details;
    halt_->set_callback([&](HaltReason reason, const std::string& details) {
        seen = reason;
        seen_details = details;
    });

    halt_->activate(HaltReason::ILLEGAL_TRANSITION, "REDUCE fill in FLAT", 5);
    EXPECT_EQ(seen, HaltReason::ILLEGAL_TRANSITION);
    EXPECT_EQ(seen_details, "REDUCE fill in FLAT");
}

TEST_F(HaltControllerTest, History_RecordsActivationAndReset) {
    halt_->activate(HaltReason::MANUAL, "first", 1);
    halt_->reset("resolved");

    auto history = halt_->get_event_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_TRUE(history[0].is_activation);
    EXPECT_EQ(history[0].cycle, 1u);
    EXPECT_FALSE(history[1].is_activation);
    EXPECT_EQ(history[1].details, "resolved");
    EXPECT_EQ(history[1].reason, HaltReason::MANUAL);
}

TEST_F(HaltControllerTest, History_BoundedByLimit) {
    HaltController small(2);
    for (int i = 0; i < 3; ++i) {
        small.activate(HaltReason::MANUAL, "round " + std::to_string(i), i);
        small.reset("clear " + std::to_string(i));
    }

    auto history = small.get_event_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].details, "round 2");
    EXPECT_EQ(history[1].details, "clear 2");
}
