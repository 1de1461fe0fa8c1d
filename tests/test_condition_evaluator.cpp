// =============================================================================
// Unit tests for ConditionEvaluator (src/scenario/condition_evaluator.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "scenario/condition_evaluator.hpp"
#include "scenario_fakes.hpp"

using namespace autoscene;
using namespace autoscene::test;

// ---------------------------------------------------------------------------
// CE-1: supplier receives the condition path and area size
// ---------------------------------------------------------------------------
TEST(ConditionEvaluatorTest, SupplierGetsPathAndAreaSize) {
    FakeImageDetector detector;
    std::string seen_path;
    int seen_w = 0, seen_h = 0;
    auto bmp = std::make_shared<const Bitmap>(30, 20);
    ConditionEvaluator evaluator(detector, [&](const std::string& p, int w, int h) {
        seen_path = p;
        seen_w = w;
        seen_h = h;
        return bmp;
    });

    Condition c = makeCondition("ok");
    c.area = Rect{5, 6, 30, 20};
    auto result = evaluator.evaluate(c);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(seen_path, "ok.png");
    EXPECT_EQ(seen_w, 30);
    EXPECT_EQ(seen_h, 20);
    EXPECT_EQ(evaluator.detectionCount(), 1u);
}

// ---------------------------------------------------------------------------
// CE-2: null bitmap -> nullopt without touching the detector
// ---------------------------------------------------------------------------
TEST(ConditionEvaluatorTest, NullBitmapIsNotEvaluable) {
    FakeImageDetector detector;
    ConditionEvaluator evaluator(detector, [](const std::string&, int, int) {
        return std::shared_ptr<const Bitmap>();
    });

    EXPECT_FALSE(evaluator.evaluate(makeCondition("gone")).has_value());
    EXPECT_EQ(detector.detectionCalls(), 0);
    EXPECT_EQ(evaluator.detectionCount(), 0u);
}

TEST(ConditionEvaluatorTest, EmptyPathIsNotEvaluable) {
    FakeTemplates templates;
    FakeImageDetector detector;
    ConditionEvaluator evaluator(detector, templates.supplier());

    Condition c = makeCondition("x");
    c.path = std::string();
    EXPECT_FALSE(evaluator.evaluate(c).has_value());
    EXPECT_EQ(templates.supply_calls, 0);
}

// ---------------------------------------------------------------------------
// CE-3: EXACT and WHOLE_SCREEN dispatch to their overloads
// ---------------------------------------------------------------------------
TEST(ConditionEvaluatorTest, DispatchesOnDetectionType) {
    FakeTemplates templates;
    FakeImageDetector detector;
    detector.script(templates.add("a.png"), true, {7, 8});
    ConditionEvaluator evaluator(detector, templates.supplier());

    auto exact = evaluator.evaluate(makeCondition("a", true, ExactDetection{}));
    auto whole = evaluator.evaluate(makeCondition("a", true, WholeScreenDetection{}));

    ASSERT_TRUE(exact && whole);
    EXPECT_EQ(detector.exact_calls, 1);
    EXPECT_EQ(detector.whole_screen_calls, 1);
    EXPECT_EQ(whole->position, (Point{7, 8}));
}

// ---------------------------------------------------------------------------
// CE-4: polarity is not applied here (raw detection is returned)
// ---------------------------------------------------------------------------
TEST(ConditionEvaluatorTest, ReturnsRawDetection) {
    FakeTemplates templates;
    FakeImageDetector detector;
    detector.script(templates.add("a.png"), true);
    ConditionEvaluator evaluator(detector, templates.supplier());

    auto r = evaluator.evaluate(makeCondition("a", false));
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->is_detected);
}

TEST(ConditionEvaluatorTest, EmptySupplierThrows) {
    FakeImageDetector detector;
    EXPECT_THROW(ConditionEvaluator(detector, BitmapSupplier()), std::invalid_argument);
}
