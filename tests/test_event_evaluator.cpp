// =============================================================================
// Unit tests for EventEvaluator (src/scenario/event_evaluator.hpp)
// AND/OR short-circuit, detection polarity, missing templates, cancellation
// =============================================================================
#include <gtest/gtest.h>
#include "scenario/event_evaluator.hpp"
#include "scenario_fakes.hpp"

using namespace autoscene;
using namespace autoscene::test;

class EventEvaluatorTest : public ::testing::Test {
protected:
    FakeTemplates templates;
    FakeImageDetector detector;
    ConditionEvaluator conditions{detector, templates.supplier()};
    EventEvaluator evaluator{conditions};
};

// ---------------------------------------------------------------------------
// EE-1: AND, C1 expected+detected, C2 expected-absent+absent -> matched
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, AndMatchesWhenEveryPolarityHolds) {
    detector.script(templates.add("C1.png"), true, {40, 50});
    detector.script(templates.add("C2.png"), false);

    Event e1 = makeEvent(1, ConditionOperator::AND,
                         {makeCondition("C1", true), makeCondition("C2", false)});
    auto outcome = evaluator.evaluate(e1);

    EXPECT_TRUE(outcome.matched);
    EXPECT_EQ(outcome.event, &e1);
    EXPECT_EQ(outcome.condition, &e1.conditions[1]);
    ASSERT_TRUE(outcome.detection.has_value());
    EXPECT_FALSE(outcome.detection->is_detected);
    EXPECT_EQ(detector.detectionCalls(), 2);
}

// ---------------------------------------------------------------------------
// EE-2: AND stops at the first unsatisfied condition
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, AndShortCircuitsOnFirstFailure) {
    detector.script(templates.add("C1.png"), false);
    detector.script(templates.add("C2.png"), true);
    detector.script(templates.add("C3.png"), true);

    Event e = makeEvent(1, ConditionOperator::AND,
                        {makeCondition("C1"), makeCondition("C2"), makeCondition("C3")});
    auto outcome = evaluator.evaluate(e);

    EXPECT_FALSE(outcome.matched);
    EXPECT_EQ(outcome.condition, &e.conditions[0]);
    EXPECT_EQ(detector.detectionCalls(), 1);
}

// ---------------------------------------------------------------------------
// EE-3: OR, C1 missing, C2 present -> matched at C2, C3 never checked
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, OrShortCircuitsOnFirstSuccess) {
    auto c1 = templates.add("C1.png");
    auto c2 = templates.add("C2.png");
    auto c3 = templates.add("C3.png");
    detector.script(c1, false);
    detector.script(c2, true, {120, 80});
    detector.script(c3, true);

    Event e2 = makeEvent(2, ConditionOperator::OR,
                         {makeCondition("C1"), makeCondition("C2"), makeCondition("C3")});
    auto outcome = evaluator.evaluate(e2);

    EXPECT_TRUE(outcome.matched);
    EXPECT_EQ(outcome.condition, &e2.conditions[1]);
    EXPECT_EQ(outcome.detection->position, (Point{120, 80}));
    ASSERT_EQ(detector.checked.size(), 2u);
    EXPECT_EQ(detector.checked[0], c1.get());
    EXPECT_EQ(detector.checked[1], c2.get());
}

// ---------------------------------------------------------------------------
// EE-4: OR with nothing satisfied -> not matched, last condition attached
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, OrWithoutSuccessDoesNotMatch) {
    detector.script(templates.add("C1.png"), false);
    detector.script(templates.add("C2.png"), false);

    Event e = makeEvent(1, ConditionOperator::OR, {makeCondition("C1"), makeCondition("C2")});
    auto outcome = evaluator.evaluate(e);

    EXPECT_FALSE(outcome.matched);
    EXPECT_EQ(outcome.event, &e);
    EXPECT_EQ(outcome.condition, &e.conditions[1]);
    EXPECT_EQ(detector.detectionCalls(), 2);
}

// ---------------------------------------------------------------------------
// EE-5: should_be_detected=false is satisfied by absence only
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, NegativeConditionFailsWhenDetected) {
    detector.script(templates.add("popup.png"), true);

    Event e = makeEvent(1, ConditionOperator::AND, {makeCondition("popup", false)});
    EXPECT_FALSE(evaluator.evaluate(e).matched);
}

// ---------------------------------------------------------------------------
// EE-6: unfetchable template -> not matched, nothing attached, no detection
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, MissingTemplateYieldsEmptyOutcome) {
    detector.script(templates.add("C2.png"), true);

    Event e = makeEvent(1, ConditionOperator::OR, {makeCondition("absent"), makeCondition("C2")});
    auto outcome = evaluator.evaluate(e);

    EXPECT_FALSE(outcome.matched);
    EXPECT_EQ(outcome.event, nullptr);
    EXPECT_EQ(outcome.condition, nullptr);
    EXPECT_FALSE(outcome.detection.has_value());
    EXPECT_EQ(detector.detectionCalls(), 0);
}

TEST_F(EventEvaluatorTest, ConditionWithoutPathYieldsEmptyOutcome) {
    Condition c = makeCondition("nopath");
    c.path.reset();
    Event e = makeEvent(1, ConditionOperator::AND, {c});

    auto outcome = evaluator.evaluate(e);
    EXPECT_FALSE(outcome.matched);
    EXPECT_EQ(outcome.event, nullptr);
    EXPECT_EQ(templates.supply_calls, 0);
}

// ---------------------------------------------------------------------------
// EE-7: detection type selects the detector call shape
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, WholeScreenUsesSearchOverload) {
    detector.script(templates.add("W.png"), true);
    detector.script(templates.add("X.png"), true);

    Event e = makeEvent(1, ConditionOperator::AND,
                        {makeCondition("W", true, WholeScreenDetection{}),
                         makeCondition("X", true, ExactDetection{})});
    EXPECT_TRUE(evaluator.evaluate(e).matched);
    EXPECT_EQ(detector.whole_screen_calls, 1);
    EXPECT_EQ(detector.exact_calls, 1);
}

// ---------------------------------------------------------------------------
// EE-8: cancellation is honoured between conditions only
// ---------------------------------------------------------------------------
TEST_F(EventEvaluatorTest, CancelledTokenStopsBeforeNextCondition) {
    detector.script(templates.add("C1.png"), true);
    detector.script(templates.add("C2.png"), true);

    CancellationToken token;
    token.cancel();
    Event e = makeEvent(1, ConditionOperator::AND, {makeCondition("C1"), makeCondition("C2")});
    auto outcome = evaluator.evaluate(e, token);

    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.matched);
    EXPECT_EQ(detector.detectionCalls(), 1);
}

TEST_F(EventEvaluatorTest, DecidedOutcomeWinsOverCancellation) {
    detector.script(templates.add("C1.png"), true);

    CancellationToken token;
    token.cancel();
    Event e = makeEvent(1, ConditionOperator::AND, {makeCondition("C1")});
    auto outcome = evaluator.evaluate(e, token);

    EXPECT_FALSE(outcome.cancelled);
    EXPECT_TRUE(outcome.matched);
}

// ---------------------------------------------------------------------------
// EE-9: condition hooks bracket every detection
// ---------------------------------------------------------------------------
TEST(EventEvaluatorListenerTest, ConditionHooksAreNotified) {
    FakeTemplates templates;
    FakeImageDetector detector;
    RecordingListener listener;
    ConditionEvaluator conditions(detector, templates.supplier());
    EventEvaluator evaluator(conditions, listener);

    detector.script(templates.add("A.png"), false);
    detector.script(templates.add("B.png"), true);
    Event e = makeEvent(1, ConditionOperator::OR, {makeCondition("A"), makeCondition("B")});
    evaluator.evaluate(e);

    std::vector<std::string> expected = {
        "condition_started:A", "condition_completed:0",
        "condition_started:B", "condition_completed:1",
    };
    EXPECT_EQ(listener.log, expected);
}
