// =============================================================================
// Unit tests for Result<T, E> (src/result.hpp)
// Scenario / template / frame error paths carried through Result:
// kind codes, propagation across layers, value access contracts
// =============================================================================
#include <gtest/gtest.h>
#include "result.hpp"
#include "detection/template_store.hpp"
#include "runner/frame_source.hpp"
#include "scenario/scenario_loader.hpp"

#include <utility>

using namespace autoscene;

namespace {

// 呼び出し側のラッパ: ローダーのエラーをそのまま上位へ返す
Result<size_t, ScenarioError> countEnabledOnStart(const std::string& json_text) {
    auto loaded = loadScenarioFromJson(json_text);
    if (loaded.is_err()) return loaded.error();
    size_t n = 0;
    for (const auto& e : loaded.value().events) {
        if (e.enabled_on_start) n++;
    }
    return n;
}

// ScenarioError → 汎用 Error への変換（ランナー層の境界）
Result<void> checkScenario(const Scenario& s) {
    auto v = validateScenario(s);
    if (v.is_err()) return Error("scenario rejected: " + v.error().message, v.error().code);
    return {};
}

} // namespace

// ---------------------------------------------------------------------------
// R-1: kind codes survive propagation through a caller
// ---------------------------------------------------------------------------
TEST(ResultTest, ScenarioErrorKindPropagates) {
    auto ok = countEnabledOnStart(R"({ "events": [ { "id": 1 },
                                                  { "id": 2, "enabled_on_start": false } ] })");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 1u);

    auto parse = countEnabledOnStart("{ broken");
    ASSERT_TRUE(parse.is_err());
    EXPECT_EQ(parse.error().kind, ScenarioError::Kind::Parse);
    EXPECT_EQ(parse.error().code, static_cast<int>(ScenarioError::Kind::Parse));

    auto ref = countEnabledOnStart(R"({ "events": [ { "id": 1 } ],
                                        "end_conditions": [ { "event_id": 9 } ] })");
    ASSERT_TRUE(ref.is_err());
    EXPECT_EQ(ref.error().kind, ScenarioError::Kind::UnknownReference);
    EXPECT_NE(ref.error().message.find("9"), std::string::npos);
}

TEST(ResultTest, ScenarioErrorConvertsToGenericError) {
    Scenario s;
    s.detection_quality = 0;
    auto r = checkScenario(s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, static_cast<int>(ScenarioError::Kind::InvalidValue));
    EXPECT_EQ(r.error().message.rfind("scenario rejected: ", 0), 0u);

    s.detection_quality = 1200;
    EXPECT_TRUE(checkScenario(s).is_ok());
}

// ---------------------------------------------------------------------------
// R-2: IoError kinds from frame / template loading
// ---------------------------------------------------------------------------
TEST(ResultTest, IoErrorKindsFromFrameLoading) {
    auto frame = runner::loadFrame("__no_such_frame__.png");
    ASSERT_TRUE(frame.is_err());
    EXPECT_EQ(frame.error().kind, IoError::Kind::DecodeFailed);
    EXPECT_FALSE(static_cast<bool>(frame));

    auto dir = runner::listFrameFiles("__no_such_dir__");
    ASSERT_TRUE(dir.is_err());
    EXPECT_EQ(dir.error().kind, IoError::Kind::NotFound);
    EXPECT_EQ(dir.error().code, static_cast<int>(IoError::Kind::NotFound));
}

TEST(ResultTest, VoidResultFromTemplateStore) {
    TemplateStore store;
    Result<void> ok = store.registerBitmap("ok.png", Bitmap(4, 4));
    EXPECT_TRUE(ok.is_ok());
    EXPECT_THROW(ok.error(), std::runtime_error);

    Result<void> bad = store.registerBitmap("", Bitmap(4, 4));
    ASSERT_TRUE(bad.is_err());
    EXPECT_FALSE(bad.error().message.empty());
    EXPECT_EQ(store.size(), 1u);
}

// ---------------------------------------------------------------------------
// R-3: access contracts
// ---------------------------------------------------------------------------
TEST(ResultTest, ValueOnErrorThrowsWithMessage) {
    ScenarioResult r = ScenarioError("event 3: bad area", ScenarioError::Kind::InvalidValue);
    try {
        (void)r.value();
        FAIL() << "value() on error must throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("event 3: bad area"), std::string::npos);
    }
    EXPECT_FALSE(r.ok().has_value());
}

TEST(ResultTest, ErrorOnSuccessThrows) {
    ScenarioResult r = Scenario{};
    EXPECT_TRUE(r.is_ok());
    EXPECT_THROW(r.error(), std::runtime_error);
    ASSERT_TRUE(r.ok().has_value());
    EXPECT_EQ(r.ok()->detection_quality, Scenario{}.detection_quality);
}

TEST(ResultTest, ValueOrFallsBackToDefaultScenario) {
    Scenario fallback;
    fallback.name = "fallback";
    auto r = loadScenarioFromJson("[]");
    EXPECT_EQ(r.value_or(fallback).name, "fallback");

    auto good = loadScenarioFromJson(R"({ "name": "daily" })");
    EXPECT_EQ(good.value_or(fallback).name, "daily");
}

TEST(ResultTest, MoveOutLoadedScenario) {
    auto r = loadScenarioFromJson(R"({ "name": "daily", "events": [ { "id": 4 } ] })");
    ASSERT_TRUE(r.is_ok());
    Scenario s = std::move(r).value();
    EXPECT_EQ(s.name, "daily");
    ASSERT_EQ(s.events.size(), 1u);
    EXPECT_EQ(s.events[0].id, 4);
}
