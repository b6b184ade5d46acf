#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "drone_platform.hpp"
#include "enum_table.hpp"
#include "sensor_value.hpp"

namespace bebop {

/** Поле состояния полёта. */
inline constexpr std::string_view FLYING_STATE_FIELD =
    "FlyingStateChanged_state";
/** Событие завершения относительного перемещения. */
inline constexpr std::string_view MOVE_BY_END_FIELD = "PilotingEvent_moveByEnd";
/** Событие изменения ориентации камеры. */
inline constexpr std::string_view CAMERA_ORIENTATION_FIELD =
    "CameraState_OrientationV2";

/**
 * @brief Результат SensorStateStore::Update()
 */
enum class UpdateResult : uint8_t {
  Stored = 0,          ///< Значение записано как есть / как метка enum
  StoredUnknownEnum,   ///< Enum-индекс не разрешён, записан UnknownEnum
  MissingName,         ///< Имя поля отсутствует, ничего не изменено
  MissingValue         ///< Значение обычного поля отсутствует, ничего не изменено
};

/**
 * @brief Снимок состояния аппарата, собранный из телеметрии
 *
 * Последнее значение каждого именованного поля (last-write-wins) плюс три
 * производных флага для циклов управления:
 * - flying_state: зеркало FlyingStateChanged_state (начально Unknown);
 * - relative_move_ended: выставляется событием PilotingEvent_moveByEnd;
 * - camera_move_ended: выставляется событием CameraState_OrientationV2.
 *
 * Флаги обновляются только при точном совпадении имени поля и никогда не
 * сбрасываются самим хранилищем.
 *
 * Потокобезопасно: пишет TelemetryDispatcher, читает BebopControl.
 * Значение поля записывается раньше производного флага под одной блокировкой.
 */
class SensorStateStore {
 public:
  /**
   * @brief Конструктор
   * @param log Приёмник предупреждений (nullptr: без логирования)
   */
  explicit SensorStateStore(const LogSink* log = nullptr) noexcept
      : log_(log) {}

  SensorStateStore(const SensorStateStore&) = delete;
  SensorStateStore& operator=(const SensorStateStore&) = delete;

  /**
   * @brief Применить значение поля телеметрии
   *
   * Не бросает исключений: отсутствующее имя логируется и пропускается,
   * неразрешимый enum-индекс нормализуется в UnknownEnum.
   *
   * @param name Имя поля (nullopt, если кодек не распознал поле)
   * @param value Сырое значение от кодека
   * @param enums Таблица перечислений
   */
  UpdateResult Update(std::optional<std::string_view> name,
                      const std::optional<Scalar>& value,
                      const EnumTable& enums);

  /**
   * @brief Текущее значение поля
   * @return nullopt, если поле ни разу не приходило
   */
  [[nodiscard]] std::optional<SensorValue> Get(std::string_view name) const;

  [[nodiscard]] FlyingState GetFlyingState() const;
  [[nodiscard]] bool IsRelativeMoveEnded() const;
  [[nodiscard]] bool IsCameraMoveEnded() const;

  /** Копия всех полей. */
  [[nodiscard]] std::map<std::string, SensorValue, std::less<>> Snapshot()
      const;

  [[nodiscard]] size_t Size() const;

  /** "Bebop sensors: {name: value, ...}" */
  [[nodiscard]] std::string ToString() const;

 private:
  void Warn(const std::string& msg) const;

  const LogSink* log_;

  mutable std::mutex mutex_;
  std::map<std::string, SensorValue, std::less<>> sensors_;
  FlyingState flying_state_{FlyingState::Unknown};
  bool relative_move_ended_{false};
  bool camera_move_ended_{false};
};

}  // namespace bebop
