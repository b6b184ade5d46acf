#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "command_types.hpp"

namespace bebop {

/**
 * @brief Уровни логирования
 */
enum class LogLevel : uint8_t { Info = 0, Warning, Error };

/**
 * @brief Приёмник лог-сообщений
 *
 * Компоненты ядра получают его по ссылке/указателю; глобального логгера нет.
 */
class LogSink {
 public:
  virtual ~LogSink() = default;

  /**
   * @brief Вывод лог-сообщения
   * @param level Уровень важности
   * @param msg Текст сообщения (UTF-8)
   */
  virtual void Log(LogLevel level, std::string_view msg) const = 0;
};

/**
 * @brief Входящий пакет телеметрии (до декодирования)
 */
struct TelemetryPacket {
  uint8_t data_type{0};
  uint8_t buffer_id{0};
  uint8_t sequence_number{0};
  std::span<const uint8_t> payload{};
  bool ack_required{false};
};

/**
 * @brief Получатель входящих пакетов (реализуется TelemetryDispatcher)
 */
class TelemetrySink {
 public:
  virtual ~TelemetrySink() = default;

  virtual void OnTelemetryPacket(const TelemetryPacket& packet) = 0;
};

/**
 * @brief Абстрактный интерфейс платформы для BebopControl
 *
 * Транспорт (Wi-Fi сессия, кадрирование, sequence numbers, низкоуровневые
 * ACK), монотонное время и логирование. Реализация предоставляется целевой
 * платформой (симулятор, реальный Wi-Fi стек).
 *
 * @note Входящие пакеты передаются в TelemetrySink, зарегистрированный через
 * SetTelemetrySink(). SmartSleep() обязан обрабатывать входящие пакеты во
 * время ожидания.
 */
class DronePlatform : public LogSink {
 public:
  // ─────────────────────────────────────────────────────────────────────────
  // Соединение
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Установить соединение с аппаратом
   * @param num_retries Количество повторных попыток
   * @return true при успехе
   */
  [[nodiscard]] virtual bool Connect(int num_retries) = 0;

  /**
   * @brief Закрыть соединение
   */
  virtual void Disconnect() = 0;

  /**
   * @brief Зарегистрировать получателя телеметрии (nullptr: отписаться)
   */
  virtual void SetTelemetrySink(TelemetrySink* sink) = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Отправка команд
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Отправить команду без параметров с подтверждением доставки
   * @return true, если аппарат подтвердил приём
   */
  [[nodiscard]] virtual bool SendAckCommand(const CommandDescriptor& cmd) = 0;

  /**
   * @brief Отправить команду с enum-аргументом с подтверждением доставки
   * @return true, если аппарат подтвердил приём
   */
  [[nodiscard]] virtual bool SendAckEnumCommand(const CommandDescriptor& cmd,
                                                const EnumSelector& arg) = 0;

  /**
   * @brief Отправить команду пилотирования (PCMD)
   * @param pcmd Значения осей (уже ограничены)
   * @param duration_s Подсказка длительности в секундах
   * @return true, если транспорт принял команду
   */
  [[nodiscard]] virtual bool SendPcmd(const CommandDescriptor& cmd,
                                      const PcmdCommand& pcmd,
                                      double duration_s) = 0;

  /**
   * @brief Подтвердить входящий пакет
   */
  virtual void AckPacket(uint8_t buffer_id, uint8_t sequence_number) = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Время
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Текущее время в миллисекундах
   * @return Монотонное время с момента старта
   */
  [[nodiscard]] virtual uint32_t GetTimeMs() const noexcept = 0;

  /**
   * @brief Ожидание с обработкой входящих пакетов
   *
   * Не блокирует приём телеметрии: все пакеты, пришедшие за время ожидания,
   * передаются в TelemetrySink до возврата.
   *
   * @param duration_ms Длительность ожидания в миллисекундах
   */
  virtual void SmartSleep(uint32_t duration_ms) = 0;
};

}  // namespace bebop
