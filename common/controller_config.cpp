#include "controller_config.hpp"

#include <algorithm>
#include <limits>

#include "json_util.hpp"

namespace bebop {

namespace {

// Отрицательные значения для беззнаковых полей превращаем в 0 до Clamp()
uint32_t ToU32(int64_t v) {
  if (v < 0) return 0;
  return static_cast<uint32_t>(
      std::min<int64_t>(v, std::numeric_limits<uint32_t>::max()));
}

int ToInt(int64_t v) {
  v = std::clamp<int64_t>(v, std::numeric_limits<int>::min(),
                          std::numeric_limits<int>::max());
  return static_cast<int>(v);
}

}  // namespace

std::optional<ControllerConfig> ControllerConfigFromJson(std::string_view json) {
  auto root = json::Parse(json);
  if (!root || !cJSON_IsObject(root.get())) return std::nullopt;

  ControllerConfig config;
  if (auto v = json::GetInt(root.get(), "poll_interval_ms")) {
    config.poll_interval_ms = ToU32(*v);
  }
  if (auto v = json::GetInt(root.get(), "default_safe_timeout_ms")) {
    config.default_safe_timeout_ms = ToU32(*v);
  }
  if (auto v = json::GetInt(root.get(), "connect_retries")) {
    config.connect_retries = ToInt(*v);
  }
  if (auto v = json::GetInt(root.get(), "pcmd_limit")) {
    config.pcmd_limit = ToInt(*v);
  }
  config.Clamp();
  return config;
}

std::string ControllerConfigToJson(const ControllerConfig& config) {
  json::CJsonPtr root(cJSON_CreateObject());
  if (!root) return {};
  cJSON_AddNumberToObject(root.get(), "poll_interval_ms",
                          config.poll_interval_ms);
  cJSON_AddNumberToObject(root.get(), "default_safe_timeout_ms",
                          config.default_safe_timeout_ms);
  cJSON_AddNumberToObject(root.get(), "connect_retries",
                          config.connect_retries);
  cJSON_AddNumberToObject(root.get(), "pcmd_limit", config.pcmd_limit);
  return json::Print(root.get());
}

}  // namespace bebop
