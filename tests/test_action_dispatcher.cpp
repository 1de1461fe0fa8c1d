// =============================================================================
// Unit tests for ActionDispatcher (src/scenario/action_dispatcher.hpp)
// Position resolution, randomization bounds, TOGGLE_EVENT side effects
// =============================================================================
#include <gtest/gtest.h>
#include "scenario/action_dispatcher.hpp"
#include "scenario_fakes.hpp"

using namespace autoscene;
using namespace autoscene::test;

class ActionDispatcherTest : public ::testing::Test {
protected:
    static std::vector<Event> events() {
        return {makeEvent(1, ConditionOperator::AND, {makeCondition("a")}),
                makeEvent(2, ConditionOperator::AND, {makeCondition("b")})};
    }

    RecordingExecutor executor;
    ScenarioState state{events()};
};

// ---------------------------------------------------------------------------
// AD-1: fixed click passes through unchanged
// ---------------------------------------------------------------------------
TEST_F(ActionDispatcherTest, FixedClickUnchanged) {
    ActionDispatcher dispatcher(executor, state, false);
    EXPECT_EQ(dispatcher.executeActions({makeClick(100, 200)}, Point{1, 2}), 1u);

    ASSERT_EQ(executor.actions.size(), 1u);
    EXPECT_EQ(executor.actions[0].x, 100);
    EXPECT_EQ(executor.actions[0].y, 200);
    EXPECT_EQ(executor.actions[0].duration_ms, 50);
}

// ---------------------------------------------------------------------------
// AD-2: on_detected_position uses the detection result
// ---------------------------------------------------------------------------
TEST_F(ActionDispatcherTest, ClickOnDetectedPosition) {
    ActionDispatcher dispatcher(executor, state, false);
    dispatcher.executeActions({makeClick(0, 0, true)}, Point{321, 654});

    ASSERT_EQ(executor.actions.size(), 1u);
    EXPECT_EQ(executor.actions[0].x, 321);
    EXPECT_EQ(executor.actions[0].y, 654);
}

TEST_F(ActionDispatcherTest, ClickOnDetectedPositionWithoutPositionIsSkipped) {
    ActionDispatcher dispatcher(executor, state, false);
    Action pause;
    pause.type = Action::Type::PAUSE;
    pause.duration_ms = 500;

    EXPECT_EQ(dispatcher.executeActions({makeClick(0, 0, true), pause}, std::nullopt), 1u);
    ASSERT_EQ(executor.actions.size(), 1u);
    EXPECT_EQ(executor.actions[0].type, Action::Type::PAUSE);
}

// ---------------------------------------------------------------------------
// AD-3: randomization stays inside its bounds
// ---------------------------------------------------------------------------
TEST_F(ActionDispatcherTest, RandomizeWithinBounds) {
    ActionDispatcher dispatcher(executor, state, true, 12345u);
    Action swipe;
    swipe.type = Action::Type::SWIPE;
    swipe.x = 100; swipe.y = 100; swipe.x2 = 400; swipe.y2 = 100;
    swipe.duration_ms = 300;

    for (int i = 0; i < 200; ++i) {
        dispatcher.executeActions({makeClick(50, 60), swipe}, std::nullopt);
    }
    ASSERT_EQ(executor.actions.size(), 400u);

    bool any_moved = false;
    for (const auto& a : executor.actions) {
        const int px = ActionDispatcher::kRandomizePositionPx;
        if (a.type == Action::Type::CLICK) {
            EXPECT_GE(a.x, 50 - px); EXPECT_LE(a.x, 50 + px);
            EXPECT_GE(a.y, 60 - px); EXPECT_LE(a.y, 60 + px);
            EXPECT_GE(a.duration_ms, 50);
            EXPECT_LE(a.duration_ms, 50 + ActionDispatcher::kRandomizeDurationMs);
            if (a.x != 50 || a.y != 60) any_moved = true;
        } else {
            EXPECT_GE(a.x2, 400 - px); EXPECT_LE(a.x2, 400 + px);
            EXPECT_GE(a.duration_ms, 300);
            EXPECT_LE(a.duration_ms, 300 + ActionDispatcher::kRandomizeDurationMs);
        }
    }
    EXPECT_TRUE(any_moved);
}

TEST_F(ActionDispatcherTest, CoordinatesNeverNegative) {
    ActionDispatcher dispatcher(executor, state, true, 7u);
    for (int i = 0; i < 50; ++i) dispatcher.executeActions({makeClick(0, 0)}, std::nullopt);
    for (const auto& a : executor.actions) {
        EXPECT_GE(a.x, 0);
        EXPECT_GE(a.y, 0);
    }
}

// ---------------------------------------------------------------------------
// AD-4: TOGGLE_EVENT updates state and is not forwarded
// ---------------------------------------------------------------------------
TEST_F(ActionDispatcherTest, ToggleEventUpdatesState) {
    ActionDispatcher dispatcher(executor, state, false);
    Action toggle;
    toggle.type = Action::Type::TOGGLE_EVENT;
    toggle.toggle_event_id = 2;
    toggle.toggle_type = ToggleType::DISABLE;

    EXPECT_EQ(dispatcher.executeActions({toggle}, std::nullopt), 0u);
    EXPECT_TRUE(executor.actions.empty());
    EXPECT_FALSE(state.isEventEnabled(2));
    EXPECT_TRUE(state.isEventEnabled(1));
}
