#include "drone_platform_sim.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>

#include "config.hpp"
#include "json_telemetry_codec.hpp"
#include "sensor_state_store.hpp"

namespace bebop::sim {

static const char* TAG = "bebop_sim";

namespace {

auto Key(const CommandDescriptor& cmd) {
  return std::make_tuple(cmd.project_id, cmd.class_id, cmd.command_id);
}

CommandDescriptor FindDescriptor(const CommandTable& commands,
                                 std::string_view domain,
                                 std::string_view klass,
                                 std::string_view command) {
  const CommandDef* def = commands.Find(domain, klass, command);
  return def ? def->descriptor : CommandDescriptor{};
}

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "?";
}

}  // namespace

DronePlatformSim::DronePlatformSim(const CommandTable& commands,
                                   EnumTable enums)
    : enums_(std::move(enums)) {
  takeoff_ = FindDescriptor(commands, "ardrone3", "Piloting", "TakeOff");
  landing_ = FindDescriptor(commands, "ardrone3", "Piloting", "Landing");
  all_states_ = FindDescriptor(commands, "common", "Common", "AllStates");
  emergency_ = FindDescriptor(commands, "ardrone3", "Piloting", "Emergency");
}

// ─────────────────────────────────────────────────────────────────────────
// Соединение
// ─────────────────────────────────────────────────────────────────────────

bool DronePlatformSim::Connect(int num_retries) {
  const int attempts = std::max(1, num_retries);
  for (int i = 0; i < attempts; ++i) {
    time_ms_ += SIM_CONNECT_ATTEMPT_MS;
    if (connect_failures_ > 0) {
      --connect_failures_;
      Log(LogLevel::Warning, "connection attempt failed");
      continue;
    }
    connected_ = true;
    return true;
  }
  return false;
}

void DronePlatformSim::Disconnect() {
  connected_ = false;
  outbox_.clear();
}

// ─────────────────────────────────────────────────────────────────────────
// Команды
// ─────────────────────────────────────────────────────────────────────────

bool DronePlatformSim::AcceptCommand(const CommandDescriptor& cmd) {
  ++send_attempts_;
  if (!connected_) return false;
  if (drop_commands_ > 0) {
    // Пакет потерян: ACK от аппарата не придёт
    --drop_commands_;
    return false;
  }
  ++delivered_[Key(cmd)];
  return true;
}

bool DronePlatformSim::SendAckCommand(const CommandDescriptor& cmd) {
  if (!AcceptCommand(cmd)) return false;

  if (cmd == takeoff_) {
    OnTakeOff();
  } else if (cmd == landing_) {
    OnLanding();
  } else if (cmd == all_states_) {
    OnAllStates();
  } else if (cmd == emergency_) {
    TriggerEmergency();
  }
  return true;
}

bool DronePlatformSim::SendAckEnumCommand(const CommandDescriptor& cmd,
                                          const EnumSelector& arg) {
  if (arg.value >= arg.enum_size) return false;
  // Флип на земле аппарат принимает, но не выполняет
  return AcceptCommand(cmd);
}

bool DronePlatformSim::SendPcmd(const CommandDescriptor& cmd,
                                const PcmdCommand& pcmd, double duration_s) {
  if (!AcceptCommand(cmd)) return false;

  const bool moving =
      pcmd.roll != 0 || pcmd.pitch != 0 || pcmd.yaw != 0 || pcmd.vertical != 0;
  if (moving && state_ == FlyingState::Hovering) {
    SetState(FlyingState::Flying);
    // NaN и отрицательные длительности дают 0; момент возврата в висение
    // насыщается до конца шкалы времени
    const double max_ms = std::numeric_limits<uint32_t>::max() - time_ms_;
    const double dur =
        duration_s > 0.0 ? std::min(duration_s * 1000.0, max_ms) : 0.0;
    const auto dur_ms = static_cast<uint32_t>(dur);
    transitions_.push_back({time_ms_ + dur_ms, FlyingState::Hovering});
  }
  return true;
}

void DronePlatformSim::AckPacket(uint8_t buffer_id, uint8_t sequence_number) {
  const auto key = std::make_pair(buffer_id, sequence_number);
  auto it = std::find(awaiting_ack_.begin(), awaiting_ack_.end(), key);
  if (it != awaiting_ack_.end()) awaiting_ack_.erase(it);
  acked_.push_back(key);
}

void DronePlatformSim::OnTakeOff() {
  if (state_ != FlyingState::Landed) return;
  if (ignore_takeoffs_ > 0) {
    --ignore_takeoffs_;
    return;
  }
  transitions_.clear();
  transitions_.push_back(
      {time_ms_ + SIM_COMMAND_LATENCY_MS, FlyingState::TakingOff});
  transitions_.push_back(
      {time_ms_ + SIM_COMMAND_LATENCY_MS + SIM_TAKEOFF_DURATION_MS,
       FlyingState::Hovering});
}

void DronePlatformSim::OnLanding() {
  if (!IsAirborne()) return;
  transitions_.clear();
  transitions_.push_back(
      {time_ms_ + SIM_COMMAND_LATENCY_MS, FlyingState::Landing});
  transitions_.push_back(
      {time_ms_ + SIM_COMMAND_LATENCY_MS + SIM_LANDING_DURATION_MS,
       FlyingState::Landed});
}

void DronePlatformSim::OnAllStates() {
  Publish({FlyingStateEvent(), BatteryEvent(),
           TelemetryEvent{"AlertStateChanged_state", Scalar(int64_t{0})},
           TelemetryEvent{"AllStatesChanged", Scalar(int64_t{0})}},
          true);
}

void DronePlatformSim::TriggerEmergency() {
  transitions_.clear();
  SetState(FlyingState::Emergency);
}

void DronePlatformSim::InjectUnnamedField() {
  Publish({TelemetryEvent{std::nullopt, Scalar(int64_t{42})}}, false);
}

// ─────────────────────────────────────────────────────────────────────────
// Время и модель
// ─────────────────────────────────────────────────────────────────────────

void DronePlatformSim::SmartSleep(uint32_t duration_ms) {
  // Пакеты, созданные командами до сна, уходят сразу
  DeliverPending();

  uint32_t remaining = duration_ms;
  while (remaining > 0) {
    const uint32_t step = std::min<uint32_t>(SIM_TICK_MS, remaining);
    time_ms_ += step;
    remaining -= step;
    if (IsAirborne()) battery_accum_ms_ += step;
    Step();
    DeliverPending();
  }
}

void DronePlatformSim::Step() {
  // Переходы применяются по времени в порядке планирования
  while (!transitions_.empty() && transitions_.front().at_ms <= time_ms_) {
    const FlyingState next = transitions_.front().state;
    transitions_.erase(transitions_.begin());
    SetState(next);
  }

  if (battery_accum_ms_ >= 10000 && battery_ > 0) {
    battery_accum_ms_ -= 10000;
    --battery_;
    Publish({BatteryEvent()}, false);
  }
}

void DronePlatformSim::SetState(FlyingState state) {
  if (state == state_) return;
  state_ = state;
  Publish({FlyingStateEvent()}, true);
}

bool DronePlatformSim::IsAirborne() const noexcept {
  switch (state_) {
    case FlyingState::TakingOff:
    case FlyingState::Hovering:
    case FlyingState::Flying:
    case FlyingState::UserTakeoff:
    case FlyingState::MotorRamping:
      return true;
    default:
      return false;
  }
}

TelemetryEvent DronePlatformSim::FlyingStateEvent() const {
  TelemetryEvent ev{std::string(FLYING_STATE_FIELD), std::nullopt};
  if (const auto* labels = enums_.Find(FLYING_STATE_FIELD)) {
    auto it = std::find(labels->begin(), labels->end(), FlyingStateName(state_));
    if (it != labels->end()) {
      ev.value = Scalar(static_cast<int64_t>(it - labels->begin()));
    }
  }
  return ev;
}

TelemetryEvent DronePlatformSim::BatteryEvent() const {
  return TelemetryEvent{"BatteryStateChanged_percent",
                        Scalar(static_cast<int64_t>(battery_))};
}

// ─────────────────────────────────────────────────────────────────────────
// Доставка
// ─────────────────────────────────────────────────────────────────────────

void DronePlatformSim::Publish(std::vector<TelemetryEvent> events,
                               bool ack_required) {
  if (!connected_) return;

  Packet p;
  p.data_type = ack_required ? SIM_DATA_TYPE_DATA_WITH_ACK : SIM_DATA_TYPE_DATA;
  p.buffer_id = ack_required ? SIM_BUFFER_EVENT_ACK : SIM_BUFFER_EVENT_NOACK;
  p.sequence_number = next_seq_[p.buffer_id]++;
  p.ack_required = ack_required;
  p.payload = EncodeTelemetryJson(events);
  outbox_.push_back(std::move(p));
}

void DronePlatformSim::DeliverPending() {
  while (!outbox_.empty()) {
    Packet p = std::move(outbox_.front());
    outbox_.pop_front();
    if (sink_ == nullptr) continue;

    if (p.ack_required) {
      awaiting_ack_.emplace_back(p.buffer_id, p.sequence_number);
    }
    TelemetryPacket packet;
    packet.data_type = p.data_type;
    packet.buffer_id = p.buffer_id;
    packet.sequence_number = p.sequence_number;
    packet.payload = std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(p.payload.data()), p.payload.size());
    packet.ack_required = p.ack_required;
    sink_->OnTelemetryPacket(packet);
  }
}

int DronePlatformSim::GetDeliveredCount(const CommandDescriptor& cmd) const {
  auto it = delivered_.find(Key(cmd));
  return it == delivered_.end() ? 0 : it->second;
}

// ─────────────────────────────────────────────────────────────────────────
// Логирование
// ─────────────────────────────────────────────────────────────────────────

void DronePlatformSim::Log(LogLevel level, std::string_view msg) const {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(min_log_level_)) {
    return;
  }
  std::printf("[%s] %s: %.*s\n", TAG, LevelName(level),
              static_cast<int>(msg.size()), msg.data());
}

}  // namespace bebop::sim
