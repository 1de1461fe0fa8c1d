#pragma once
// =============================================================================
// AutoScene Config Loader
// =============================================================================
// Loads runner settings from config.json with nlohmann/json.
// Every key falls back to its default when missing or mistyped.
// =============================================================================

#include <string>
#include <fstream>
#include "autoscene_log.hpp"

#include <nlohmann/json.hpp>

namespace autoscene {
namespace config {

struct DetectionConfig {
    int quality_override = 0;        // >0: シナリオの detection_quality を上書き
    bool randomize_override = false; // true: シナリオに関係なくランダム化
};

struct RunnerConfig {
    std::string templates_dir;       // 空 = シナリオファイルと同じディレクトリ
    int loops = 1;                   // フレーム列の周回数 (0 = 停止まで無限)
    int frame_interval_ms = 0;       // フレーム間の待機
    bool publish_condition_events = false;
};

struct LogConfig {
    std::string log_path = "autoscene.log";
    std::string level = "info";
};

struct AppConfig {
    DetectionConfig detection;
    RunnerConfig runner;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.is_object() || !j.contains(section) || !j[section].is_object()) return def;
    const auto& sec = j[section];
    if (!sec.contains(key)) return def;
    try {
        return sec[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        ALOG_WARN("config", "%s.%s: %s (default used)", section.c_str(), key.c_str(), e.what());
        return def;
    }
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "config.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("../config.json");
    }
    if (!file.is_open()) {
        ALOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);

        config.detection.quality_override = jsonGet<int>(j, "detection", "quality_override", 0);
        config.detection.randomize_override = jsonGet<bool>(j, "detection", "randomize_override", false);

        config.runner.templates_dir = jsonGet<std::string>(j, "runner", "templates_dir", "");
        config.runner.loops = jsonGet<int>(j, "runner", "loops", 1);
        config.runner.frame_interval_ms = jsonGet<int>(j, "runner", "frame_interval_ms", 0);
        config.runner.publish_condition_events =
            jsonGet<bool>(j, "runner", "publish_condition_events", false);

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "autoscene.log");
        config.log.level = jsonGet<std::string>(j, "log", "level", "info");

    } catch (const nlohmann::json::exception& e) {
        ALOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    if (config.runner.loops < 0) config.runner.loops = 1;
    if (config.runner.frame_interval_ms < 0) config.runner.frame_interval_ms = 0;

    ALOG_INFO("config", "Loaded: quality_override=%d loops=%d log=%s",
              config.detection.quality_override, config.runner.loops,
              config.log.log_path.c_str());
    return config;
}

} // namespace config
} // namespace autoscene
