#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "command_table.hpp"
#include "drone_platform.hpp"
#include "enum_table.hpp"
#include "sensor_value.hpp"
#include "telemetry_decoder.hpp"

namespace bebop::sim {

/**
 * @brief Реализация DronePlatform: Bebop, смоделированный в процессе
 *
 * Виртуальное время (мс) двигается только внутри SmartSleep() и Connect().
 * Модель реагирует на TakeOff / Landing / PCMD / Flip / AllStates с задержками
 * из config.hpp и публикует телеметрию JSON-кодеком (json_telemetry_codec).
 * Пакеты доставляются в TelemetrySink в потоке вызывающего, внутри
 * SmartSleep(); события с флагом ACK ожидают AckPacket().
 *
 * Для сценариев потери связи есть DropNextCommands(), IgnoreNextTakeoffs(),
 * TriggerEmergency(), InjectUnnamedField().
 */
class DronePlatformSim : public DronePlatform {
 public:
  explicit DronePlatformSim(const CommandTable& commands = CommandTable::Builtin(),
                            EnumTable enums = EnumTable::Builtin());

  // Соединение
  [[nodiscard]] bool Connect(int num_retries) override;
  void Disconnect() override;
  void SetTelemetrySink(TelemetrySink* sink) override { sink_ = sink; }

  // Команды
  [[nodiscard]] bool SendAckCommand(const CommandDescriptor& cmd) override;
  [[nodiscard]] bool SendAckEnumCommand(const CommandDescriptor& cmd,
                                        const EnumSelector& arg) override;
  [[nodiscard]] bool SendPcmd(const CommandDescriptor& cmd,
                              const PcmdCommand& pcmd,
                              double duration_s) override;
  void AckPacket(uint8_t buffer_id, uint8_t sequence_number) override;

  // Время
  [[nodiscard]] uint32_t GetTimeMs() const noexcept override { return time_ms_; }
  void SmartSleep(uint32_t duration_ms) override;

  // Логирование
  void Log(LogLevel level, std::string_view msg) const override;

  // ─────────────────────────────────────────────────────────────────────────
  // Управление симуляцией
  // ─────────────────────────────────────────────────────────────────────────

  /** Первые n попыток соединения завершатся неудачей. */
  void SetConnectFailures(int n) noexcept { connect_failures_ = n; }

  /** Следующие n команд с подтверждением теряются (send вернёт false). */
  void DropNextCommands(int n) noexcept { drop_commands_ = n; }

  /** Следующие n TakeOff доставляются, но аппарат их игнорирует. */
  void IgnoreNextTakeoffs(int n) noexcept { ignore_takeoffs_ = n; }

  /** Аппарат немедленно переходит в emergency. */
  void TriggerEmergency();

  /** Опубликовать событие, которое кодек не смог разрешить (без имени). */
  void InjectUnnamedField();

  /** Минимальный уровень вывода в лог (по умолчанию Info). */
  void SetMinLogLevel(LogLevel level) noexcept { min_log_level_ = level; }

  // ─────────────────────────────────────────────────────────────────────────
  // Наблюдение
  // ─────────────────────────────────────────────────────────────────────────

  [[nodiscard]] FlyingState GetModelState() const noexcept { return state_; }
  [[nodiscard]] int GetBatteryPercent() const noexcept { return battery_; }
  [[nodiscard]] bool IsConnected() const noexcept { return connected_; }

  /** Доставленных (не потерянных) команд с данным дескриптором. */
  [[nodiscard]] int GetDeliveredCount(const CommandDescriptor& cmd) const;

  /** Все попытки отправки, включая потерянные. */
  [[nodiscard]] int GetSendAttempts() const noexcept { return send_attempts_; }

  /** Подтверждённые пакеты (buffer_id, sequence_number). */
  [[nodiscard]] const std::vector<std::pair<uint8_t, uint8_t>>& GetAckedPackets()
      const noexcept {
    return acked_;
  }

  /** Пакеты, ожидающие подтверждения. */
  [[nodiscard]] size_t GetUnackedCount() const noexcept {
    return awaiting_ack_.size();
  }

 private:
  struct Transition {
    uint32_t at_ms;
    FlyingState state;
  };

  struct Packet {
    uint8_t data_type;
    uint8_t buffer_id;
    uint8_t sequence_number;
    bool ack_required;
    std::string payload;
  };

  bool AcceptCommand(const CommandDescriptor& cmd);
  void OnTakeOff();
  void OnLanding();
  void OnAllStates();

  void Step();
  void SetState(FlyingState state);
  void Publish(std::vector<TelemetryEvent> events, bool ack_required);
  void DeliverPending();

  [[nodiscard]] TelemetryEvent FlyingStateEvent() const;
  [[nodiscard]] TelemetryEvent BatteryEvent() const;
  [[nodiscard]] bool IsAirborne() const noexcept;

  // Дескрипторы из таблицы команд
  CommandDescriptor takeoff_{};
  CommandDescriptor landing_{};
  CommandDescriptor all_states_{};
  CommandDescriptor emergency_{};

  EnumTable enums_;
  TelemetrySink* sink_{nullptr};

  // Time
  uint32_t time_ms_{0};
  uint32_t battery_accum_ms_{0};

  // Link
  bool connected_{false};
  int connect_failures_{0};
  int drop_commands_{0};
  int ignore_takeoffs_{0};
  int send_attempts_{0};
  std::map<std::tuple<uint8_t, uint8_t, uint16_t>, int> delivered_;
  std::map<uint8_t, uint8_t> next_seq_;
  std::deque<Packet> outbox_;
  std::vector<std::pair<uint8_t, uint8_t>> awaiting_ack_;
  std::vector<std::pair<uint8_t, uint8_t>> acked_;

  // Model
  FlyingState state_{FlyingState::Landed};
  std::vector<Transition> transitions_;
  int battery_{100};

  LogLevel min_log_level_{LogLevel::Info};
};

}  // namespace bebop::sim
