// =============================================================================
// AutoScene Runner - Entry Point
// =============================================================================
// 画像ディレクトリをキャプチャ列としてシナリオを再生する。
//   autoscene_runner <scenario.json> <frames_dir>
//                    [--config path] [--loops N] [--templates dir]
//                    [--log-level trace|debug|info|warn|error]
// 終了コード: 0=正常 / 1=引数・読込エラー / 2=処理中の契約違反
// =============================================================================

#include "autoscene_log.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "detection/cpu_image_detector.hpp"
#include "detection/template_store.hpp"
#include "runner/frame_player.hpp"
#include "runner/frame_source.hpp"
#include "runner/logging_action_executor.hpp"
#include "scenario/bus_progress_listener.hpp"
#include "scenario/scenario_loader.hpp"
#include "scenario/scenario_processor.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

using namespace autoscene;

static CancellationToken g_cancel;

static void onSignal(int) {
    g_cancel.cancel();
}

static void printUsage(const char* argv0) {
    fprintf(stderr,
            "usage: %s <scenario.json> <frames_dir> [--config path] [--loops N]\n"
            "          [--templates dir] [--log-level level]\n", argv0);
}

struct Args {
    std::string scenario_path;
    std::string frames_dir;
    std::string config_path = "config.json";
    bool config_explicit = false;
    int loops = -1;               // -1 = config値
    std::string templates_dir;
    std::string log_level;
};

static bool parseArgs(int argc, char** argv, Args& out) {
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (a == "--config") {
            if (!next(out.config_path)) return false;
            out.config_explicit = true;
        } else if (a == "--loops") {
            std::string v;
            if (!next(v)) return false;
            out.loops = atoi(v.c_str());
        } else if (a == "--templates") {
            if (!next(out.templates_dir)) return false;
        } else if (a == "--log-level") {
            if (!next(out.log_level)) return false;
        } else if (a == "-h" || a == "--help") {
            return false;
        } else if (positional == 0) {
            out.scenario_path = a;
            positional++;
        } else if (positional == 1) {
            out.frames_dir = a;
            positional++;
        } else {
            return false;
        }
    }
    return positional == 2;
}

int main(int argc, char** argv) {
    Args args;
    if (!parseArgs(argc, argv, args)) {
        printUsage(argv[0]);
        return 1;
    }

    // --- 設定 ---
    config::AppConfig cfg = config::loadConfig(args.config_path, args.config_explicit);
    log::setLogLevel(log::parseLevel(args.log_level.empty() ? cfg.log.level : args.log_level));
    if (!cfg.log.log_path.empty() && !log::openLogFile(cfg.log.log_path.c_str())) {
        ALOG_WARN("main", "cannot open log file %s", cfg.log.log_path.c_str());
    }
    const int loops = args.loops >= 0 ? args.loops : cfg.runner.loops;

    // --- シナリオ ---
    auto loaded = loadScenarioFromFile(args.scenario_path);
    if (loaded.is_err()) {
        ALOG_ERROR("main", "scenario: %s", loaded.error().message.c_str());
        return 1;
    }
    Scenario scenario = std::move(loaded).value();
    if (cfg.detection.quality_override > 0) scenario.detection_quality = cfg.detection.quality_override;
    if (cfg.detection.randomize_override) scenario.randomize = true;

    // --- テンプレート ---
    TemplateStoreConfig store_cfg;
    store_cfg.base_dir = !args.templates_dir.empty() ? args.templates_dir
                       : !cfg.runner.templates_dir.empty() ? cfg.runner.templates_dir
                       : std::filesystem::u8path(args.scenario_path).parent_path().u8string();
    TemplateStore store(store_cfg);

    // --- フレーム ---
    auto frames = runner::listFrameFiles(args.frames_dir);
    if (frames.is_err()) {
        ALOG_ERROR("main", "%s", frames.error().message.c_str());
        return 1;
    }
    if (frames.value().empty()) {
        ALOG_ERROR("main", "no frames in %s", args.frames_dir.c_str());
        return 1;
    }

    // --- 処理系 ---
    CpuImageDetector detector;
    runner::LoggingActionExecutor executor;
    BusProgressListener progress;

    int stop_requests = 0;
    auto on_stop = [&]() { stop_requests++; };

    auto stop_sub = bus().subscribe<ScenarioStopEvent>([](const ScenarioStopEvent& e) {
        ALOG_INFO("main", "scenario '%s' stopped: %s", e.scenario_name.c_str(), e.reason.c_str());
    });

    auto match_sub = bus().subscribe<EventMatchEvent>([](const EventMatchEvent& e) {
        if (!e.matched) return;
        ALOG_INFO("main", "frame %llu: event %d (%s) matched by '%s' at (%d,%d) conf=%.3f",
                  (unsigned long long)e.frame_index, e.event_id, e.event_name.c_str(),
                  e.condition_name.c_str(), e.x, e.y, e.confidence);
    });
    SubscriptionHandle cond_sub;
    if (cfg.runner.publish_condition_events) {
        cond_sub = bus().subscribe<ConditionCheckedEvent>([](const ConditionCheckedEvent& e) {
            ALOG_DEBUG("main", "  condition '%s' detected=%d conf=%.3f",
                       e.condition_name.c_str(), e.detected ? 1 : 0, e.confidence);
        });
    }

    ProcessorConfig pcfg;
    pcfg.detection_quality = scenario.detection_quality;
    pcfg.randomize = scenario.randomize;
    pcfg.end_condition_operator = scenario.end_condition_operator;

    ScenarioProcessor processor(detector, pcfg, scenario.events, store.asSupplier(), executor,
                                scenario.end_conditions, on_stop, &progress);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // --- 再生ループ ---
    runner::PlaybackOptions play_opts;
    play_opts.loops = loops;
    play_opts.frame_interval_ms = cfg.runner.frame_interval_ms;

    runner::PlaybackResult played;
    try {
        played = runner::playFrames(processor, frames.value(), play_opts, g_cancel,
                                    runner::loadFrame);
    } catch (const std::exception& e) {
        ALOG_FATAL("main", "processing aborted: %s", e.what());
        log::closeLogFile();
        return 2;
    }
    const PassStatus status = played.status;

    ScenarioStopEvent stop_evt;
    stop_evt.scenario_name = scenario.name;
    switch (status) {
        case PassStatus::STOPPED:             stop_evt.reason = "end_condition"; break;
        case PassStatus::ALL_EVENTS_DISABLED: stop_evt.reason = "all_disabled"; break;
        case PassStatus::CANCELLED:           stop_evt.reason = "cancelled"; break;
        case PassStatus::COMPLETED:
            stop_evt.reason = played.no_loadable_frames ? "no_loadable_frames" : "frames_exhausted";
            break;
    }
    bus().publish(stop_evt);
    ALOG_DEBUG("main", "stop callback invocations: %d", stop_requests);

    const ProcessorStats stats = processor.getStats();
    ALOG_INFO("main", "finished: %s frames=%llu skipped=%llu matched=%llu actions=%llu detections=%llu",
              passStatusToString(status),
              (unsigned long long)stats.frames_processed,
              (unsigned long long)played.frames_skipped,
              (unsigned long long)stats.events_matched,
              (unsigned long long)stats.actions_dispatched,
              (unsigned long long)stats.detection_calls);
    log::closeLogFile();
    return played.no_loadable_frames ? 1 : 0;
}
