#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "config_common.hpp"

namespace bebop {

/**
 * @brief Параметры BebopControl
 *
 * Значения по умолчанию берутся из config_common.hpp (могут быть
 * переопределены в platform config.hpp).
 */
struct ControllerConfig {
  /**
   * Период опроса состояния в safe-циклах (мс).
   * Диапазон: 10–5000 мс, по умолчанию 1000 мс.
   */
  uint32_t poll_interval_ms{SAFE_ACTION_POLL_INTERVAL_MS};

  /**
   * Таймаут safe-действий, если вызывающий не задал свой (мс).
   * Диапазон: 0–600000 мс.
   */
  uint32_t default_safe_timeout_ms{SAFE_ACTION_DEFAULT_TIMEOUT_MS};

  /** Попыток соединения в Connect() по умолчанию. Диапазон: 1–100. */
  int connect_retries{CONNECT_DEFAULT_RETRIES};

  /** Предел по каждой оси PCMD. Диапазон: 1–100. */
  int pcmd_limit{PCMD_AXIS_LIMIT};

  /**
   * @brief Проверить валидность конфигурации
   * @return true если конфигурация валидна
   */
  [[nodiscard]] bool IsValid() const noexcept {
    return poll_interval_ms >= 10 && poll_interval_ms <= 5000 &&
           default_safe_timeout_ms <= 600000 && connect_retries >= 1 &&
           connect_retries <= 100 && pcmd_limit >= 1 && pcmd_limit <= 100;
  }

  /**
   * @brief Сбросить конфигурацию к значениям по умолчанию
   */
  void Reset() noexcept {
    poll_interval_ms = SAFE_ACTION_POLL_INTERVAL_MS;
    default_safe_timeout_ms = SAFE_ACTION_DEFAULT_TIMEOUT_MS;
    connect_retries = CONNECT_DEFAULT_RETRIES;
    pcmd_limit = PCMD_AXIS_LIMIT;
  }

  /**
   * @brief Применить ограничения к параметрам
   */
  void Clamp() noexcept {
    if (poll_interval_ms < 10) poll_interval_ms = 10;
    if (poll_interval_ms > 5000) poll_interval_ms = 5000;
    if (default_safe_timeout_ms > 600000) default_safe_timeout_ms = 600000;
    if (connect_retries < 1) connect_retries = 1;
    if (connect_retries > 100) connect_retries = 100;
    if (pcmd_limit < 1) pcmd_limit = 1;
    if (pcmd_limit > 100) pcmd_limit = 100;
  }
};

/**
 * @brief Загрузить конфигурацию из JSON-объекта
 *
 * Отсутствующие ключи остаются по умолчанию, неизвестные игнорируются,
 * значения вне диапазона ограничиваются (Clamp()).
 *
 * Ключи: "poll_interval_ms", "default_safe_timeout_ms", "connect_retries",
 * "pcmd_limit".
 *
 * @return nullopt, если текст не является JSON-объектом
 */
[[nodiscard]] std::optional<ControllerConfig> ControllerConfigFromJson(
    std::string_view json);

/** Сериализация в JSON-объект с теми же ключами. */
[[nodiscard]] std::string ControllerConfigToJson(const ControllerConfig& config);

}  // namespace bebop
