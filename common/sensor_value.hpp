#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace bebop {

/** Метка enum-значения, разрешённая по таблице перечислений. */
struct EnumLabel {
  std::string label;

  bool operator==(const EnumLabel&) const = default;
};

/**
 * Значение enum-поля, которое не удалось разрешить (индекс отсутствует или
 * вне объявленного диапазона). Хранится вместо сырого индекса.
 */
struct UnknownEnum {
  bool operator==(const UnknownEnum&) const = default;
};

/** Сырое скалярное значение, как его отдаёт кодек. */
using Scalar = std::variant<bool, int64_t, double, std::string>;

/** Значение поля в SensorStateStore. */
using SensorValue =
    std::variant<bool, int64_t, double, std::string, EnumLabel, UnknownEnum>;

/** Текстовое представление для логов и ToString(). */
[[nodiscard]] std::string SensorValueToString(const SensorValue& value);

/** Текстовое представление сырого значения кодека. */
[[nodiscard]] std::string ScalarToString(const Scalar& value);

// ═══════════════════════════════════════════════════════════════════════════
// Flying state
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Фаза полёта, сообщаемая аппаратом (FlyingStateChanged_state)
 *
 * Unknown: начальное значение до первой телеметрии, а также любые метки,
 * которых нет в списке ниже.
 */
enum class FlyingState : uint8_t {
  Unknown = 0,
  Landed,
  TakingOff,
  Hovering,
  Flying,
  Landing,
  Emergency,
  UserTakeoff,
  MotorRamping,
  EmergencyLanding
};

/** Метка протокола ("takingoff", "hovering", ...) → FlyingState. */
[[nodiscard]] FlyingState FlyingStateFromLabel(std::string_view label) noexcept;

/** FlyingState → метка протокола; Unknown → "unknown". */
[[nodiscard]] const char* FlyingStateName(FlyingState state) noexcept;

}  // namespace bebop
