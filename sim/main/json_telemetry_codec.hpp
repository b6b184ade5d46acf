#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "enum_table.hpp"
#include "telemetry_decoder.hpp"

namespace bebop::sim {

/**
 * @brief Кодек телеметрии симулятора (JSON через cJSON)
 *
 * Payload: массив объектов {"name": "...", "value": ...}. "name" == null или
 * отсутствует → событие без имени; "value" может быть bool, числом или
 * строкой, целые числа передаются как int64.
 *
 * @example
 * @code
 * [{"name": "FlyingStateChanged_state", "value": 2},
 *  {"name": "BatteryStateChanged_percent", "value": 87}]
 * @endcode
 */
class JsonTelemetryDecoder : public TelemetryDecoder {
 public:
  explicit JsonTelemetryDecoder(EnumTable enums) : enums_(std::move(enums)) {}

  [[nodiscard]] std::vector<TelemetryEvent> Decode(
      std::span<const uint8_t> payload) override;

  [[nodiscard]] const EnumTable& Enums() const noexcept override {
    return enums_;
  }

 private:
  EnumTable enums_;
};

/** Кодирование событий в payload симулятора. */
[[nodiscard]] std::string EncodeTelemetryJson(
    const std::vector<TelemetryEvent>& events);

}  // namespace bebop::sim
