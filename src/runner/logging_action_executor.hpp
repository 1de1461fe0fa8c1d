#pragma once
// =============================================================================
// LoggingActionExecutor — 入力注入の代わりにアクションを記録する実行系
// =============================================================================
// 実機への注入層が無い環境（リプレイ・検証）用。解決済みアクションを
// ログ出力し、ActionExecutedEvent を発行する。
// =============================================================================

#include "autoscene_log.hpp"
#include "event_bus.hpp"
#include "scenario/action_dispatcher.hpp"

#include <cstdint>

namespace autoscene::runner {

class LoggingActionExecutor : public ActionExecutor {
public:
    explicit LoggingActionExecutor(EventBus& event_bus = bus()) : bus_(event_bus) {}

    void execute(const Action& a) override {
        executed_++;
        switch (a.type) {
            case Action::Type::CLICK:
                ALOG_INFO("action", "CLICK %s (%d,%d) %dms", a.name.c_str(), a.x, a.y, a.duration_ms);
                break;
            case Action::Type::SWIPE:
                ALOG_INFO("action", "SWIPE %s (%d,%d)→(%d,%d) %dms", a.name.c_str(),
                          a.x, a.y, a.x2, a.y2, a.duration_ms);
                break;
            case Action::Type::PAUSE:
                ALOG_INFO("action", "PAUSE %s %dms", a.name.c_str(), a.duration_ms);
                break;
            case Action::Type::TOGGLE_EVENT:
                break;
        }

        ActionExecutedEvent evt;
        evt.action_type = actionTypeToString(a.type);
        evt.action_name = a.name;
        evt.x = a.x;
        evt.y = a.y;
        evt.x2 = a.x2;
        evt.y2 = a.y2;
        evt.duration_ms = a.duration_ms;
        bus_.publish(evt);
    }

    uint64_t executedCount() const { return executed_; }

private:
    EventBus& bus_;
    uint64_t executed_ = 0;
};

} // namespace autoscene::runner
