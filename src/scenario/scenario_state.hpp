// =============================================================================
// ScenarioState — イベント集合と有効/無効状態
// =============================================================================
// 処理スレッド専有: setEventEnabled / toggleEvent / getEnabledEvents
// 任意スレッド:     requestEventEnabled → 次のパス境界で applyPendingRequests()
// 「全イベント無効」は終了条件満了とは別の終端条件。
// =============================================================================
#pragma once

#include "scenario/scenario_model.hpp"

#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace autoscene {

class ScenarioState {
public:
    explicit ScenarioState(std::vector<Event> events);

    // 宣言順（= 優先度順）の有効イベント
    std::vector<const Event*> getEnabledEvents() const;
    bool areAllEventsDisabled() const;

    bool isEventEnabled(int event_id) const;
    // @return false: 未知のイベントID
    bool setEventEnabled(int event_id, bool enabled);
    bool toggleEvent(int event_id, ToggleType toggle);

    // 外部スレッドからの変更要求（パス境界で適用）
    void requestEventEnabled(int event_id, bool enabled);
    size_t applyPendingRequests();

    // シナリオ再開: enabled_on_start に戻す
    void reset();

    const std::vector<Event>& events() const { return events_; }
    const Event* findEvent(int event_id) const;

private:
    std::vector<Event> events_;
    std::vector<bool> enabled_;                 // events_ と同じ並び
    std::unordered_map<int, size_t> index_;     // event_id → events_ index

    std::mutex pending_mutex_;
    std::vector<std::pair<int, bool>> pending_;
};

} // namespace autoscene
