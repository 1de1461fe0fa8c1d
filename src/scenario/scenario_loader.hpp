#pragma once
// =============================================================================
// ScenarioLoader — シナリオJSON → Scenario
// =============================================================================
// {
//   "name": "daily",
//   "detection_quality": 1200, "randomize": false,
//   "end_condition_operator": "OR",
//   "events": [{
//     "id": 1, "name": "ok", "operator": "AND", "enabled_on_start": true,
//     "conditions": [{ "name": "ok_btn", "path": "ok.png",
//                      "area": {"x":10,"y":20,"width":64,"height":32},
//                      "threshold": 4, "detection_type": "EXACT",
//                      "should_be_detected": true }],
//     "actions": [{ "type": "click", "on_detected_position": true },
//                 { "type": "toggle_event", "event_id": 2, "toggle": "disable" }]
//   }],
//   "end_conditions": [{ "event_id": 1, "executions": 3 }]
// }
// 結合子・検出方式は文字列 or 生コード(1/2)。それ以外はエラー。
// =============================================================================

#include "result.hpp"
#include "scenario/scenario_model.hpp"

#include <string>

namespace autoscene {

using ScenarioResult = autoscene::Result<Scenario, ScenarioError>;

ScenarioResult loadScenarioFromJson(const std::string& json_text);
ScenarioResult loadScenarioFromFile(const std::string& path);

// 参照整合性などの検証（JSON以外で組み立てたシナリオにも使える）
autoscene::Result<void, ScenarioError> validateScenario(const Scenario& scenario);

} // namespace autoscene
