// =============================================================================
// シナリオモデル — Event / Condition / Action / EndCondition
// =============================================================================
// Event:     順序付き条件リスト + アクション + AND/OR 結合子
//            優先度 = シナリオ内での並び順
// Condition: テンプレート + エリア + 検出方式 + 閾値 + 期待極性
//            満たされる ⇔ detected == should_be_detected
// =============================================================================
#pragma once

#include "detection/bitmap.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace autoscene {

// =============================================================================
// 結合子
// =============================================================================

enum class ConditionOperator {
    AND = 1,
    OR  = 2
};

inline const char* conditionOperatorToString(ConditionOperator op) {
    switch (op) {
        case ConditionOperator::AND: return "AND";
        case ConditionOperator::OR:  return "OR";
    }
    return "UNKNOWN";
}

// =============================================================================
// 検出方式（閉じたタグ付きバリアント）
// =============================================================================

// 条件エリアの位置だけを照合
struct ExactDetection {};
// フレーム全体を探索
struct WholeScreenDetection {};

using DetectionType = std::variant<ExactDetection, WholeScreenDetection>;

// 生コード: EXACT=1, WHOLE_SCREEN=2（シナリオファイル互換）
inline constexpr int kDetectionTypeExact = 1;
inline constexpr int kDetectionTypeWholeScreen = 2;

inline const char* detectionTypeToString(const DetectionType& type) {
    return std::holds_alternative<ExactDetection>(type) ? "EXACT" : "WHOLE_SCREEN";
}

// =============================================================================
// Condition
// =============================================================================

struct Condition {
    std::string name;
    std::optional<std::string> path;     // テンプレート参照（無し = 常に評価不能）
    Rect area;                           // テンプレートサイズ / EXACT時の照合位置
    int threshold = 4;                   // 許容差 0-100 (%)
    DetectionType detection_type = ExactDetection{};
    bool should_be_detected = true;      // false: 「見えないこと」を条件にする
};

// =============================================================================
// Action
// =============================================================================

enum class ToggleType {
    ENABLE,
    DISABLE,
    TOGGLE
};

struct Action {
    enum class Type {
        CLICK,
        SWIPE,
        PAUSE,
        TOGGLE_EVENT
    };

    Type type = Type::CLICK;
    std::string name;

    // CLICK / SWIPE
    int x = 0;
    int y = 0;
    int x2 = 0;  // swipe終点
    int y2 = 0;
    bool on_detected_position = false;   // CLICK: 検出位置をクリック
    int duration_ms = 50;                // CLICK押下時間 / SWIPE時間 / PAUSE時間

    // TOGGLE_EVENT
    int toggle_event_id = -1;
    ToggleType toggle_type = ToggleType::TOGGLE;
};

inline const char* actionTypeToString(Action::Type t) {
    switch (t) {
        case Action::Type::CLICK:        return "CLICK";
        case Action::Type::SWIPE:        return "SWIPE";
        case Action::Type::PAUSE:        return "PAUSE";
        case Action::Type::TOGGLE_EVENT: return "TOGGLE_EVENT";
    }
    return "UNKNOWN";
}

// =============================================================================
// Event
// =============================================================================

struct Event {
    int id = 0;
    std::string name;
    ConditionOperator condition_operator = ConditionOperator::AND;
    std::vector<Condition> conditions;
    std::vector<Action> actions;
    bool enabled_on_start = true;
};

// =============================================================================
// EndCondition
// =============================================================================

struct EndCondition {
    int event_id = 0;
    int executions = 1;   // この回数トリガーされたら満了
};

// =============================================================================
// Scenario（シナリオファイル1つ分）
// =============================================================================

struct Scenario {
    std::string name;
    int detection_quality = 1200;
    bool randomize = false;
    ConditionOperator end_condition_operator = ConditionOperator::AND;
    std::vector<Event> events;
    std::vector<EndCondition> end_conditions;
};

} // namespace autoscene
