#include "json_telemetry_codec.hpp"

#include <cmath>
#include <string_view>
#include <type_traits>
#include <utility>

#include "json_util.hpp"

namespace bebop::sim {

namespace {

std::optional<Scalar> DecodeValue(const cJSON* item) {
  if (item == nullptr || cJSON_IsNull(item)) return std::nullopt;
  if (cJSON_IsBool(item)) return Scalar(cJSON_IsTrue(item) != 0);
  if (cJSON_IsString(item) && item->valuestring != nullptr) {
    return Scalar(std::string(item->valuestring));
  }
  if (cJSON_IsNumber(item)) {
    const double v = item->valuedouble;
    if (std::floor(v) == v && std::fabs(v) < 9.0e15) {
      return Scalar(static_cast<int64_t>(v));
    }
    return Scalar(v);
  }
  return std::nullopt;
}

cJSON* EncodeValue(const Scalar& value) {
  return std::visit(
      [](const auto& v) -> cJSON* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return cJSON_CreateBool(v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return cJSON_CreateString(v.c_str());
        } else {
          return cJSON_CreateNumber(static_cast<double>(v));
        }
      },
      value);
}

}  // namespace

std::vector<TelemetryEvent> JsonTelemetryDecoder::Decode(
    std::span<const uint8_t> payload) {
  std::vector<TelemetryEvent> events;

  auto root = json::Parse(std::string_view(
      reinterpret_cast<const char*>(payload.data()), payload.size()));
  if (!root || !cJSON_IsArray(root.get())) return events;

  const cJSON* item = nullptr;
  cJSON_ArrayForEach(item, root.get()) {
    if (!cJSON_IsObject(item)) continue;
    TelemetryEvent ev;
    if (auto name = json::GetString(item, "name")) {
      ev.name = std::move(*name);
    }
    ev.value = DecodeValue(cJSON_GetObjectItemCaseSensitive(item, "value"));
    events.push_back(std::move(ev));
  }
  return events;
}

std::string EncodeTelemetryJson(const std::vector<TelemetryEvent>& events) {
  json::CJsonPtr root(cJSON_CreateArray());
  if (!root) return {};

  for (const auto& ev : events) {
    cJSON* obj = cJSON_CreateObject();
    if (obj == nullptr) return {};
    cJSON_AddItemToArray(root.get(), obj);

    if (ev.name) {
      cJSON_AddStringToObject(obj, "name", ev.name->c_str());
    } else {
      cJSON_AddNullToObject(obj, "name");
    }
    if (ev.value) {
      cJSON_AddItemToObject(obj, "value", EncodeValue(*ev.value));
    }
  }
  return json::Print(root.get());
}

}  // namespace bebop::sim
