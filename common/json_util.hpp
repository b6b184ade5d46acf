#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cJSON.h"

namespace bebop::json {

/** Владелец дерева cJSON. */
struct CJsonDeleter {
  void operator()(cJSON* p) const noexcept { cJSON_Delete(p); }
};
using CJsonPtr = std::unique_ptr<cJSON, CJsonDeleter>;

/** Разбор документа; nullptr при синтаксической ошибке. */
[[nodiscard]] inline CJsonPtr Parse(std::string_view text) {
  return CJsonPtr(cJSON_ParseWithLength(text.data(), text.size()));
}

/** Строковое поле объекта. */
[[nodiscard]] inline std::optional<std::string> GetString(const cJSON* obj,
                                                          const char* key) {
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
  if (!cJSON_IsString(item) || item->valuestring == nullptr) {
    return std::nullopt;
  }
  return std::string(item->valuestring);
}

/**
 * Целочисленное поле объекта (дробные значения отвергаются).
 * Значения за пределами int64 насыщаются до границы.
 */
[[nodiscard]] inline std::optional<int64_t> GetInt(const cJSON* obj,
                                                   const char* key) {
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
  if (!cJSON_IsNumber(item)) return std::nullopt;
  const double v = item->valuedouble;
  if (std::floor(v) != v) return std::nullopt;
  // 2^63 точно представимо в double, поэтому сравнение строгое
  if (v >= 9223372036854775808.0) {
    return std::numeric_limits<int64_t>::max();
  }
  if (v < -9223372036854775808.0) {
    return std::numeric_limits<int64_t>::min();
  }
  return static_cast<int64_t>(v);
}

/** Числовое поле объекта. */
[[nodiscard]] inline std::optional<double> GetNumber(const cJSON* obj,
                                                     const char* key) {
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
  if (!cJSON_IsNumber(item)) return std::nullopt;
  return item->valuedouble;
}

/** Сериализация без форматирования. */
[[nodiscard]] inline std::string Print(const cJSON* obj) {
  char* raw = cJSON_PrintUnformatted(obj);
  if (raw == nullptr) return {};
  std::string out(raw);
  cJSON_free(raw);
  return out;
}

}  // namespace bebop::json
