#include "enum_table.hpp"

#include <utility>

#include "json_util.hpp"

namespace bebop {

Result<EnumTable, DefinitionError> EnumTable::FromJson(std::string_view json) {
  auto root = json::Parse(json);
  if (!root || !cJSON_IsObject(root.get())) {
    return DefinitionError::MalformedJson;
  }

  const cJSON* enums = cJSON_GetObjectItemCaseSensitive(root.get(), "enums");
  if (!cJSON_IsObject(enums)) return DefinitionError::MissingField;

  EnumTable table;
  const cJSON* field = nullptr;
  cJSON_ArrayForEach(field, enums) {
    if (!cJSON_IsArray(field)) return DefinitionError::MalformedJson;

    std::vector<std::string> labels;
    const cJSON* label = nullptr;
    cJSON_ArrayForEach(label, field) {
      if (!cJSON_IsString(label) || label->valuestring == nullptr) {
        return DefinitionError::MalformedJson;
      }
      labels.emplace_back(label->valuestring);
    }
    if (labels.empty()) return DefinitionError::EmptyEnum;
    if (!table.Add(field->string, std::move(labels))) {
      return DefinitionError::DuplicateEntry;
    }
  }
  return table;
}

EnumTable EnumTable::Builtin() {
  EnumTable table;
  table.Add("FlyingStateChanged_state",
            {"landed", "takingoff", "hovering", "flying", "landing",
             "emergency", "usertakeoff", "motor_ramping",
             "emergency_landing"});
  table.Add("AlertStateChanged_state",
            {"none", "user", "cut_out", "critical_battery", "low_battery",
             "too_much_angle"});
  table.Add("NavigateHomeStateChanged_state",
            {"available", "inProgress", "unavailable", "pending"});
  return table;
}

bool EnumTable::Add(std::string field, std::vector<std::string> labels) {
  if (labels.empty()) return false;
  return enums_.emplace(std::move(field), std::move(labels)).second;
}

const std::vector<std::string>* EnumTable::Find(std::string_view field) const {
  auto it = enums_.find(field);
  return it == enums_.end() ? nullptr : &it->second;
}

}  // namespace bebop
