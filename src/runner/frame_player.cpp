// =============================================================================
// FramePlayer 実装
// =============================================================================
#include "runner/frame_player.hpp"
#include "autoscene_log.hpp"

#include <chrono>
#include <thread>

static constexpr const char* TAG = "player";

namespace autoscene::runner {

PlaybackResult playFrames(ScenarioProcessor& processor,
                          const std::vector<std::string>& paths,
                          const PlaybackOptions& options,
                          const CancellationToken& token,
                          const FrameLoader& loader) {
    PlaybackResult result;
    int last_w = 0, last_h = 0;

    for (int loop = 0; options.loops == 0 || loop < options.loops; ++loop) {
        uint64_t loaded_this_round = 0;

        for (const auto& path : paths) {
            if (token.isCancelled()) {
                ALOG_INFO(TAG, "cancelled before frame %s", path.c_str());
                result.status = PassStatus::CANCELLED;
                return result;
            }

            auto frame = loader(path);
            if (frame.is_err()) {
                ALOG_WARN(TAG, "skip frame: %s", frame.error().message.c_str());
                result.frames_skipped++;
                continue;
            }
            loaded_this_round++;

            const Bitmap& bmp = frame.value();
            if (bmp.width != last_w || bmp.height != last_h) {
                processor.invalidateScreenMetrics();
                last_w = bmp.width;
                last_h = bmp.height;
            }

            RawCapture capture;
            capture.rgba = bmp.rgba.data();
            capture.width = bmp.width;
            capture.height = bmp.height;

            result.status = processor.process(capture, token);
            result.frames_played++;
            if (result.status != PassStatus::COMPLETED) return result;

            if (options.frame_interval_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(options.frame_interval_ms));
            }
        }

        if (loaded_this_round == 0) {
            ALOG_ERROR(TAG, "no loadable frame in round %d (%zu files), stopping",
                       loop + 1, paths.size());
            result.no_loadable_frames = true;
            return result;
        }
    }
    return result;
}

} // namespace autoscene::runner
