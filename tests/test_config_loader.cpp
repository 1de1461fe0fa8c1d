// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, jsonGet, file loading, clamping, parse errors
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <cstdio>
#include "config_loader.hpp"

using namespace autoscene::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// C-1: AppConfig defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.detection.quality_override, 0);
    EXPECT_FALSE(cfg.detection.randomize_override);
    EXPECT_TRUE(cfg.runner.templates_dir.empty());
    EXPECT_EQ(cfg.runner.loops, 1);
    EXPECT_EQ(cfg.runner.frame_interval_ms, 0);
    EXPECT_FALSE(cfg.runner.publish_condition_events);
    EXPECT_EQ(cfg.log.log_path, "autoscene.log");
    EXPECT_EQ(cfg.log.level, "info");
}

// ---------------------------------------------------------------------------
// C-2: loadConfig with missing file returns all defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_config_xyz.json", true);
    EXPECT_EQ(cfg.runner.loops, 1);
    EXPECT_EQ(cfg.log.log_path, "autoscene.log");
}

// ---------------------------------------------------------------------------
// C-3: jsonGet falls back on missing section / key / wrong type
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, JsonGetFallbacks) {
    auto j = nlohmann::json::parse(R"({"runner": {"loops": 3, "templates_dir": 5}})");
    EXPECT_EQ(jsonGet<int>(j, "runner", "loops", 1), 3);
    EXPECT_EQ(jsonGet<int>(j, "runner", "missing", 9), 9);
    EXPECT_EQ(jsonGet<int>(j, "nosection", "loops", 7), 7);
    EXPECT_EQ(jsonGet<std::string>(j, "runner", "templates_dir", "tpl"), "tpl");
}

// ---------------------------------------------------------------------------
// C-4: loadConfig parses a temp JSON file correctly
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigFromFile) {
    const char* tmp = "__test_config_tmp.json";
    writeTmpJson(tmp, R"({
        "detection": { "quality_override": 720, "randomize_override": true },
        "runner":    { "templates_dir": "my_templates", "loops": 0, "frame_interval_ms": 33 },
        "log":       { "log_path": "custom.log", "level": "debug" }
    })");

    AppConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_EQ(cfg.detection.quality_override, 720);
    EXPECT_TRUE(cfg.detection.randomize_override);
    EXPECT_EQ(cfg.runner.templates_dir, "my_templates");
    EXPECT_EQ(cfg.runner.loops, 0);
    EXPECT_EQ(cfg.runner.frame_interval_ms, 33);
    EXPECT_EQ(cfg.log.log_path, "custom.log");
    EXPECT_EQ(cfg.log.level, "debug");
    // Unspecified fields retain defaults
    EXPECT_FALSE(cfg.runner.publish_condition_events);
}

// ---------------------------------------------------------------------------
// C-5: negative values are clamped back to sane defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, NegativeValuesClamped) {
    const char* tmp = "__test_config_tmp2.json";
    writeTmpJson(tmp, R"({ "runner": { "loops": -4, "frame_interval_ms": -1 } })");

    AppConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_EQ(cfg.runner.loops, 1);
    EXPECT_EQ(cfg.runner.frame_interval_ms, 0);
}

// ---------------------------------------------------------------------------
// C-6: broken JSON → defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, BrokenJsonReturnsDefaults) {
    const char* tmp = "__test_config_tmp3.json";
    writeTmpJson(tmp, "{ \"runner\": { \"loops\": ");

    AppConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_EQ(cfg.runner.loops, 1);
    EXPECT_EQ(cfg.log.level, "info");
}
