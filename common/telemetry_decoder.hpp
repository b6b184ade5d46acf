#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "enum_table.hpp"
#include "sensor_value.hpp"

namespace bebop {

/**
 * @brief Одно декодированное поле телеметрии
 *
 * name == nullopt означает, что кодек не смог разрешить поле (например, поле
 * намеренно не описано в таблицах). Это не ошибка.
 */
struct TelemetryEvent {
  std::optional<std::string> name;
  std::optional<Scalar> value;
};

/**
 * @brief Кодек телеметрии (внешний компонент)
 *
 * Превращает payload пакета в конечный упорядоченный список событий и
 * предоставляет таблицу перечислений, по которой хранилище разрешает
 * enum-индексы.
 */
class TelemetryDecoder {
 public:
  virtual ~TelemetryDecoder() = default;

  /**
   * @brief Декодировать payload
   * @return События в порядке следования в пакете (пусто, если разбор не
   * удался)
   */
  [[nodiscard]] virtual std::vector<TelemetryEvent> Decode(
      std::span<const uint8_t> payload) = 0;

  /** Таблица перечислений полей. */
  [[nodiscard]] virtual const EnumTable& Enums() const noexcept = 0;
};

}  // namespace bebop
