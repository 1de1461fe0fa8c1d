// =============================================================================
// ActionDispatcher 実装
// =============================================================================

#include "scenario/action_dispatcher.hpp"
#include "autoscene_log.hpp"

#include <algorithm>

namespace autoscene {

ActionDispatcher::ActionDispatcher(ActionExecutor& executor, ScenarioState& state,
                                   bool randomize, uint32_t seed)
    : executor_(executor), state_(state), randomize_(randomize), rng_(seed) {}

size_t ActionDispatcher::executeActions(const std::vector<Action>& actions,
                                        const std::optional<Point>& position) {
    size_t executed = 0;
    for (const auto& action : actions) {
        if (action.type == Action::Type::TOGGLE_EVENT) {
            state_.toggleEvent(action.toggle_event_id, action.toggle_type);
            continue;
        }

        auto resolved = resolve(action, position);
        if (!resolved) continue;
        executor_.execute(*resolved);
        executed++;
    }
    return executed;
}

std::optional<Action> ActionDispatcher::resolve(const Action& action,
                                                const std::optional<Point>& position) {
    Action out = action;

    switch (action.type) {
        case Action::Type::CLICK:
            if (action.on_detected_position) {
                if (!position) {
                    ALOG_WARN("action", "検出位置なし → CLICKスキップ: %s", action.name.c_str());
                    return std::nullopt;
                }
                out.x = position->x;
                out.y = position->y;
            }
            if (randomize_) {
                out.x = jitter(out.x, -kRandomizePositionPx, kRandomizePositionPx);
                out.y = jitter(out.y, -kRandomizePositionPx, kRandomizePositionPx);
                out.duration_ms = jitter(out.duration_ms, 0, kRandomizeDurationMs);
            }
            break;

        case Action::Type::SWIPE:
            if (randomize_) {
                out.x = jitter(out.x, -kRandomizePositionPx, kRandomizePositionPx);
                out.y = jitter(out.y, -kRandomizePositionPx, kRandomizePositionPx);
                out.x2 = jitter(out.x2, -kRandomizePositionPx, kRandomizePositionPx);
                out.y2 = jitter(out.y2, -kRandomizePositionPx, kRandomizePositionPx);
                out.duration_ms = jitter(out.duration_ms, 0, kRandomizeDurationMs);
            }
            break;

        case Action::Type::PAUSE:
            if (randomize_) out.duration_ms = jitter(out.duration_ms, 0, kRandomizeDurationMs);
            break;

        case Action::Type::TOGGLE_EVENT:
            return std::nullopt;
    }

    // 画面外（負座標）には出さない
    out.x = std::max(0, out.x);
    out.y = std::max(0, out.y);
    out.x2 = std::max(0, out.x2);
    out.y2 = std::max(0, out.y2);
    return out;
}

int ActionDispatcher::jitter(int value, int min_offset, int max_offset) {
    std::uniform_int_distribution<int> dist(min_offset, max_offset);
    return value + dist(rng_);
}

} // namespace autoscene
