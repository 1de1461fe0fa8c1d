// =============================================================================
// ScenarioLoader 実装 (nlohmann/json)
// =============================================================================

#include "scenario/scenario_loader.hpp"
#include "autoscene_log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>
#include <utility>

static constexpr const char* TAG = "loader";

// テンプレートはエリアサイズに縮尺して保持するため、1辺の上限を設ける
static constexpr int kMaxAreaSide = 16384;

namespace autoscene {

using json = nlohmann::json;

template<typename T>
using Parsed = autoscene::Result<T, ScenarioError>;

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static ScenarioError invalid(const std::string& where, const std::string& what) {
    return ScenarioError(where + ": " + what, ScenarioError::Kind::InvalidValue);
}

// =============================================================================
// 列挙値（文字列 or 生コード）
// =============================================================================

static Parsed<ConditionOperator> parseOperator(const json& j, const char* field,
                                               const std::string& where) {
    if (!j.contains(field)) return ConditionOperator::AND;
    const json& v = j.at(field);
    if (v.is_string()) {
        const std::string s = upper(v.get<std::string>());
        if (s == "AND") return ConditionOperator::AND;
        if (s == "OR") return ConditionOperator::OR;
    } else if (v.is_number_integer()) {
        const int code = v.get<int>();
        if (code == static_cast<int>(ConditionOperator::AND)) return ConditionOperator::AND;
        if (code == static_cast<int>(ConditionOperator::OR)) return ConditionOperator::OR;
    }
    return invalid(where, std::string("unexpected ") + field + " " + v.dump());
}

static Parsed<DetectionType> parseDetectionType(const json& j, const std::string& where) {
    if (!j.contains("detection_type")) return DetectionType{ExactDetection{}};
    const json& v = j.at("detection_type");
    if (v.is_string()) {
        const std::string s = upper(v.get<std::string>());
        if (s == "EXACT") return DetectionType{ExactDetection{}};
        if (s == "WHOLE_SCREEN") return DetectionType{WholeScreenDetection{}};
    } else if (v.is_number_integer()) {
        const int code = v.get<int>();
        if (code == kDetectionTypeExact) return DetectionType{ExactDetection{}};
        if (code == kDetectionTypeWholeScreen) return DetectionType{WholeScreenDetection{}};
    }
    return invalid(where, "unexpected detection_type " + v.dump());
}

// =============================================================================
// 要素パーサ
// =============================================================================

static Parsed<Condition> parseCondition(const json& j, const std::string& where) {
    if (!j.is_object()) return invalid(where, "condition must be an object");

    Condition c;
    c.name = j.value("name", std::string());
    if (j.contains("path") && !j.at("path").is_null()) {
        c.path = j.at("path").get<std::string>();
    }
    if (!j.contains("area") || !j.at("area").is_object()) {
        return invalid(where, "area is required");
    }
    const json& area = j.at("area");
    c.area.x = area.value("x", 0);
    c.area.y = area.value("y", 0);
    c.area.width = area.value("width", 0);
    c.area.height = area.value("height", 0);
    c.threshold = j.value("threshold", 4);
    c.should_be_detected = j.value("should_be_detected", true);

    auto type = parseDetectionType(j, where);
    if (type.is_err()) return type.error();
    c.detection_type = type.value();
    return c;
}

static Parsed<Action> parseAction(const json& j, const std::string& where) {
    if (!j.is_object()) return invalid(where, "action must be an object");

    Action a;
    a.name = j.value("name", std::string());
    const std::string type = upper(j.value("type", std::string("click")));
    if (type == "CLICK") {
        a.type = Action::Type::CLICK;
        a.on_detected_position = j.value("on_detected_position", false);
        a.x = j.value("x", 0);
        a.y = j.value("y", 0);
        a.duration_ms = j.value("duration_ms", 50);
    } else if (type == "SWIPE") {
        a.type = Action::Type::SWIPE;
        a.x = j.value("x", 0);
        a.y = j.value("y", 0);
        a.x2 = j.value("x2", 0);
        a.y2 = j.value("y2", 0);
        a.duration_ms = j.value("duration_ms", 300);
    } else if (type == "PAUSE") {
        a.type = Action::Type::PAUSE;
        a.duration_ms = j.value("duration_ms", 500);
    } else if (type == "TOGGLE_EVENT") {
        a.type = Action::Type::TOGGLE_EVENT;
        a.toggle_event_id = j.value("event_id", -1);
        const std::string toggle = upper(j.value("toggle", std::string("toggle")));
        if (toggle == "ENABLE") a.toggle_type = ToggleType::ENABLE;
        else if (toggle == "DISABLE") a.toggle_type = ToggleType::DISABLE;
        else if (toggle == "TOGGLE") a.toggle_type = ToggleType::TOGGLE;
        else return invalid(where, "unexpected toggle " + toggle);
    } else {
        return invalid(where, "unexpected action type " + type);
    }

    if (a.duration_ms < 0) return invalid(where, "duration_ms must be >= 0");
    return a;
}

static Parsed<Event> parseEvent(const json& j, size_t index) {
    const std::string where = "events[" + std::to_string(index) + "]";
    if (!j.is_object()) return invalid(where, "event must be an object");

    Event e;
    e.id = j.value("id", static_cast<int>(index) + 1);
    e.name = j.value("name", std::string());
    e.enabled_on_start = j.value("enabled_on_start", true);

    auto op = parseOperator(j, "operator", where);
    if (op.is_err()) return op.error();
    e.condition_operator = op.value();

    if (j.contains("conditions")) {
        const json& conds = j.at("conditions");
        for (size_t i = 0; i < conds.size(); ++i) {
            auto c = parseCondition(conds.at(i), where + ".conditions[" + std::to_string(i) + "]");
            if (c.is_err()) return c.error();
            e.conditions.push_back(std::move(c).value());
        }
    }
    if (j.contains("actions")) {
        const json& acts = j.at("actions");
        for (size_t i = 0; i < acts.size(); ++i) {
            auto a = parseAction(acts.at(i), where + ".actions[" + std::to_string(i) + "]");
            if (a.is_err()) return a.error();
            e.actions.push_back(std::move(a).value());
        }
    }
    return e;
}

// =============================================================================
// 公開API
// =============================================================================

ScenarioResult loadScenarioFromJson(const std::string& json_text) {
    Scenario scenario;
    try {
        const json j = json::parse(json_text);
        if (!j.is_object()) {
            return ScenarioError("scenario root must be an object", ScenarioError::Kind::Parse);
        }

        scenario.name = j.value("name", std::string("scenario"));
        scenario.detection_quality = j.value("detection_quality", 1200);
        scenario.randomize = j.value("randomize", false);

        auto op = parseOperator(j, "end_condition_operator", "scenario");
        if (op.is_err()) return op.error();
        scenario.end_condition_operator = op.value();

        if (j.contains("events")) {
            const json& events = j.at("events");
            for (size_t i = 0; i < events.size(); ++i) {
                auto e = parseEvent(events.at(i), i);
                if (e.is_err()) return e.error();
                scenario.events.push_back(std::move(e).value());
            }
        }
        if (j.contains("end_conditions")) {
            for (const auto& ec : j.at("end_conditions")) {
                EndCondition end;
                end.event_id = ec.at("event_id").get<int>();
                end.executions = ec.value("executions", 1);
                scenario.end_conditions.push_back(end);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return ScenarioError(std::string("JSON error: ") + e.what(), ScenarioError::Kind::Parse);
    }

    auto valid = validateScenario(scenario);
    if (valid.is_err()) return valid.error();

    ALOG_INFO(TAG, "シナリオ読込: %s events=%zu end_conditions=%zu",
              scenario.name.c_str(), scenario.events.size(), scenario.end_conditions.size());
    return scenario;
}

ScenarioResult loadScenarioFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ScenarioError("cannot open scenario file: " + path, ScenarioError::Kind::Parse);
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return loadScenarioFromJson(text);
}

autoscene::Result<void, ScenarioError> validateScenario(const Scenario& scenario) {
    if (scenario.detection_quality <= 0) {
        return invalid("scenario", "detection_quality must be > 0");
    }

    std::set<int> ids;
    for (const auto& e : scenario.events) {
        if (!ids.insert(e.id).second) {
            return invalid("event " + std::to_string(e.id), "duplicate event id");
        }
    }

    for (const auto& e : scenario.events) {
        const std::string where = "event " + std::to_string(e.id);
        if (e.conditions.empty()) {
            ALOG_WARN(TAG, "%s has no conditions, it will never match", where.c_str());
        }
        for (const auto& c : e.conditions) {
            if (c.area.empty()) return invalid(where, "condition '" + c.name + "' has empty area");
            if (c.area.width > kMaxAreaSide || c.area.height > kMaxAreaSide) {
                return invalid(where, "condition '" + c.name + "' area exceeds " +
                                      std::to_string(kMaxAreaSide) + " px per side");
            }
            if (c.threshold < 0 || c.threshold > 100) {
                return invalid(where, "condition '" + c.name + "' threshold out of 0..100");
            }
        }
        for (const auto& a : e.actions) {
            if (a.type == Action::Type::TOGGLE_EVENT && !ids.count(a.toggle_event_id)) {
                return ScenarioError(where + ": toggle target " + std::to_string(a.toggle_event_id) +
                                     " does not exist", ScenarioError::Kind::UnknownReference);
            }
        }
    }

    for (const auto& ec : scenario.end_conditions) {
        if (!ids.count(ec.event_id)) {
            return ScenarioError("end condition references unknown event " +
                                 std::to_string(ec.event_id), ScenarioError::Kind::UnknownReference);
        }
        if (ec.executions <= 0) {
            return invalid("end condition " + std::to_string(ec.event_id), "executions must be > 0");
        }
    }
    return {};
}

} // namespace autoscene
