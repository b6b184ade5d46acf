#pragma once

#include <algorithm>
#include <cstdint>

namespace bebop {

/**
 * @brief Разрешённая команда протокола (project / class / command id)
 *
 * Результат CommandTable::Resolve(). Неизменяема, безопасна для повторной
 * отправки без изменений при ретраях.
 */
struct CommandDescriptor {
  uint8_t project_id{0};
  uint8_t class_id{0};
  uint16_t command_id{0};

  bool operator==(const CommandDescriptor&) const = default;
};

/**
 * @brief Выбранный вариант enum-аргумента команды (например, направление
 * флипа)
 */
struct EnumSelector {
  uint32_t value{0};      ///< Индекс варианта в объявлении команды
  uint32_t enum_size{0};  ///< Количество вариантов в объявлении

  bool operator==(const EnumSelector&) const = default;
};

/**
 * @brief Команда пилотирования (PCMD): четыре оси [-limit..limit]
 *
 * @example
 * @code
 * auto cmd = PcmdCommand{150, -20, 0, -300}.Clamped(100);
 * // cmd.roll == 100, cmd.vertical == -100
 * @endcode
 */
struct PcmdCommand {
  int roll{0};
  int pitch{0};
  int yaw{0};
  int vertical{0};

  /** Ограничение одной оси в [-limit, limit]. */
  [[nodiscard]] static constexpr int ClampAxis(int value, int limit) noexcept {
    return std::clamp(value, -limit, limit);
  }

  /** Копия команды, каждая ось ограничена независимо. */
  [[nodiscard]] constexpr PcmdCommand Clamped(int limit) const noexcept {
    return PcmdCommand{ClampAxis(roll, limit), ClampAxis(pitch, limit),
                       ClampAxis(yaw, limit), ClampAxis(vertical, limit)};
  }

  bool operator==(const PcmdCommand&) const = default;
};

}  // namespace bebop
