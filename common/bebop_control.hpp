#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

#include "command_table.hpp"
#include "controller_config.hpp"
#include "drone_platform.hpp"
#include "sensor_state_store.hpp"
#include "telemetry_decoder.hpp"
#include "telemetry_dispatcher.hpp"

namespace bebop {

/**
 * @brief Результат прямой команды
 */
enum class ActionResult : uint8_t {
  Sent = 0,         ///< Транспорт подтвердил доставку
  NotAcknowledged,  ///< Транспорт не подтвердил доставку
  LookupFailed,     ///< Команда отсутствует в таблице определений
  InvalidArgument,  ///< Аргумент отвергнут до разрешения команды
  NotConnected      ///< Соединение не установлено
};

[[nodiscard]] const char* ActionResultName(ActionResult result) noexcept;

/**
 * @brief Управление Bebop: команды, телеметрия, safe-действия
 *
 * Использует:
 * - DronePlatform для транспорта, времени и логирования
 * - CommandTable для разрешения символических команд
 * - TelemetryDispatcher + SensorStateStore для состояния аппарата
 *
 * Прямые действия (TakeOff, Land, FlyDirect, Flip) отправляются один раз и
 * не ждут изменения состояния. SafeTakeoff/SafeLand повторяют команду, пока
 * аппарат не начнёт переход, затем ждут его завершения; emergency прерывает
 * оба этапа, общий дедлайн ограничивает всё действие.
 *
 * Ожидание внутри safe-циклов идёт через DronePlatform::SmartSleep(), поэтому
 * телеметрия продолжает поступать в хранилище.
 *
 * @example
 * @code
 * BebopControl bebop(platform, CommandTable::Builtin(), decoder);
 * if (bebop.Connect(3)) {
 *   bebop.SafeTakeoff(10000);
 *   (void)bebop.Flip("left");
 *   bebop.SafeLand(10000);
 *   bebop.Disconnect();
 * }
 * @endcode
 */
class BebopControl {
 public:
  /**
   * @brief Конструктор
   * @param platform Платформа (транспорт, время, лог); должна пережить объект
   * @param commands Таблица команд (копируется)
   * @param decoder Кодек телеметрии; должен пережить объект
   * @param config Параметры (ограничиваются Clamp())
   */
  BebopControl(DronePlatform& platform, CommandTable commands,
               TelemetryDecoder& decoder,
               const ControllerConfig& config = ControllerConfig{});
  ~BebopControl();

  BebopControl(const BebopControl&) = delete;
  BebopControl& operator=(const BebopControl&) = delete;

  // ─────────────────────────────────────────────────────────────────────────
  // Соединение
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Подключиться к аппарату с повторными попытками
   * @return true при успехе
   */
  [[nodiscard]] bool Connect(int num_retries);

  /** Connect() с количеством попыток из конфигурации. */
  [[nodiscard]] bool Connect() { return Connect(config_.connect_retries); }

  /** Отключиться; телеметрия больше не принимается. */
  void Disconnect();

  [[nodiscard]] bool IsConnected() const noexcept { return connected_.load(); }

  // ─────────────────────────────────────────────────────────────────────────
  // Прямые действия
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Запросить у аппарата полный набор состояний (common/AllStates)
   *
   * Поля заполняются по мере прихода телеметрии.
   */
  [[nodiscard]] ActionResult AskForStateUpdate();

  /** Команда взлёта (один раз, без ожидания состояния). */
  [[nodiscard]] ActionResult TakeOff();

  /** Команда посадки (один раз, без ожидания состояния). */
  [[nodiscard]] ActionResult Land();

  /**
   * @brief Прямое пилотирование (PCMD)
   *
   * Каждая ось независимо ограничивается в [-pcmd_limit, pcmd_limit];
   * значения вне диапазона не отвергаются.
   *
   * @param duration_s Длительность в секундах (передаётся транспорту)
   */
  [[nodiscard]] ActionResult FlyDirect(int roll, int pitch, int yaw,
                                       int vertical, double duration_s);

  /**
   * @brief Флип
   * @param direction "front", "back", "right" или "left" (без учёта регистра)
   * @return InvalidArgument, если направление не из списка (ничего не
   * отправляется)
   */
  [[nodiscard]] ActionResult Flip(std::string_view direction);

  // ─────────────────────────────────────────────────────────────────────────
  // Safe-действия
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Взлёт с повтором до подтверждения телеметрией
   *
   * Этап 1: пока состояние не takingoff (или уже flying/hovering), отправка
   * TakeOff и ожидание poll_interval_ms. Этап 2: ожидание flying/hovering без
   * повторной отправки. Emergency прерывает немедленно.
   *
   * По истечении таймаута просто возвращается; результат см. в Sensors().
   *
   * @param timeout_ms Общий дедлайн от момента вызова
   */
  void SafeTakeoff(uint32_t timeout_ms);

  /**
   * @brief Посадка с повтором до подтверждения телеметрией
   *
   * Этап 1: отправка Land, пока состояние не landing/landed. Этап 2: ожидание
   * landed. Emergency прерывает немедленно.
   *
   * @param timeout_ms Общий дедлайн от момента вызова
   */
  void SafeLand(uint32_t timeout_ms);

  /**
   * @brief Ожидание с обработкой телеметрии
   *
   * Использовать вместо sleep: обычный sleep останавливает приём пакетов.
   */
  void SmartSleep(uint32_t duration_ms);

  // ─────────────────────────────────────────────────────────────────────────
  // Состояние
  // ─────────────────────────────────────────────────────────────────────────

  [[nodiscard]] const SensorStateStore& Sensors() const noexcept {
    return sensors_;
  }

  [[nodiscard]] TelemetryDispatcher::Stats GetTelemetryStats() const noexcept {
    return dispatcher_.GetStats();
  }

  [[nodiscard]] const ControllerConfig& GetConfig() const noexcept {
    return config_;
  }

 private:
  /** Описание safe-действия: команда и множества состояний двух этапов. */
  struct SafeActionPlan {
    const char* name;
    ActionResult (BebopControl::*command)();
    uint32_t started_mask;    ///< Переход начался, этап 1 завершён
    uint32_t completed_mask;  ///< Переход завершён
  };

  enum class SafeActionOutcome : uint8_t { Completed, Emergency, Deadline };

  SafeActionOutcome RunSafeAction(const SafeActionPlan& plan,
                                  uint32_t timeout_ms);

  ActionResult SendNoParam(std::string_view domain, std::string_view klass,
                           std::string_view command);
  void LogLookupError(std::string_view domain, std::string_view klass,
                      std::string_view command, LookupError err) const;

  DronePlatform& platform_;
  CommandTable commands_;
  ControllerConfig config_;

  SensorStateStore sensors_;
  TelemetryDispatcher dispatcher_;

  std::atomic<bool> connected_{false};
  bool sink_registered_{false};
};

}  // namespace bebop
