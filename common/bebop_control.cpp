#include "bebop_control.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <string>
#include <utility>

namespace bebop {

namespace {

constexpr uint32_t StateBit(FlyingState state) noexcept {
  return 1u << static_cast<uint8_t>(state);
}

constexpr bool InMask(FlyingState state, uint32_t mask) noexcept {
  return (StateBit(state) & mask) != 0;
}

constexpr std::array<std::string_view, 4> kFlipDirections{"front", "back",
                                                          "right", "left"};

std::string ToLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

ActionResult FromSendResult(bool acked) noexcept {
  return acked ? ActionResult::Sent : ActionResult::NotAcknowledged;
}

}  // namespace

const char* ActionResultName(ActionResult result) noexcept {
  switch (result) {
    case ActionResult::Sent:
      return "sent";
    case ActionResult::NotAcknowledged:
      return "not acknowledged";
    case ActionResult::LookupFailed:
      return "lookup failed";
    case ActionResult::InvalidArgument:
      return "invalid argument";
    case ActionResult::NotConnected:
      return "not connected";
  }
  return "unknown";
}

// ═════════════════════════════════════════════════════════════════════════
// BebopControl Implementation
// ═════════════════════════════════════════════════════════════════════════

BebopControl::BebopControl(DronePlatform& platform, CommandTable commands,
                           TelemetryDecoder& decoder,
                           const ControllerConfig& config)
    : platform_(platform),
      commands_(std::move(commands)),
      config_(config),
      sensors_(&platform),
      dispatcher_(platform, decoder, sensors_) {
  config_.Clamp();
}

BebopControl::~BebopControl() {
  // Платформа не должна звать dispatcher_ после разрушения
  if (sink_registered_) {
    platform_.SetTelemetrySink(nullptr);
  }
}

// ─────────────────────────────────────────────────────────────────────────
// Соединение
// ─────────────────────────────────────────────────────────────────────────

bool BebopControl::Connect(int num_retries) {
  platform_.SetTelemetrySink(&dispatcher_);
  sink_registered_ = true;

  if (!platform_.Connect(num_retries)) {
    platform_.SetTelemetrySink(nullptr);
    sink_registered_ = false;
    connected_.store(false);
    platform_.Log(LogLevel::Error, "Failed to connect to the drone");
    return false;
  }

  connected_.store(true);
  platform_.Log(LogLevel::Info, "Connected to the drone");
  return true;
}

void BebopControl::Disconnect() {
  platform_.Disconnect();
  if (sink_registered_) {
    platform_.SetTelemetrySink(nullptr);
    sink_registered_ = false;
  }
  connected_.store(false);
  platform_.Log(LogLevel::Info, "Disconnected from the drone");
}

// ─────────────────────────────────────────────────────────────────────────
// Прямые действия
// ─────────────────────────────────────────────────────────────────────────

ActionResult BebopControl::SendNoParam(std::string_view domain,
                                       std::string_view klass,
                                       std::string_view command) {
  auto resolved = commands_.Resolve(domain, klass, command);
  if (IsError(resolved)) {
    LogLookupError(domain, klass, command, GetError(resolved));
    return ActionResult::LookupFailed;
  }
  if (!IsConnected()) {
    return ActionResult::NotConnected;
  }
  return FromSendResult(platform_.SendAckCommand(GetValue(resolved)));
}

ActionResult BebopControl::AskForStateUpdate() {
  return SendNoParam("common", "Common", "AllStates");
}

ActionResult BebopControl::TakeOff() {
  return SendNoParam("ardrone3", "Piloting", "TakeOff");
}

ActionResult BebopControl::Land() {
  return SendNoParam("ardrone3", "Piloting", "Landing");
}

ActionResult BebopControl::FlyDirect(int roll, int pitch, int yaw,
                                     int vertical, double duration_s) {
  const PcmdCommand pcmd =
      PcmdCommand{roll, pitch, yaw, vertical}.Clamped(config_.pcmd_limit);

  char buf[96];
  std::snprintf(buf, sizeof(buf),
                "roll is %d pitch is %d yaw is %d vertical is %d", pcmd.roll,
                pcmd.pitch, pcmd.yaw, pcmd.vertical);
  platform_.Log(LogLevel::Info, buf);

  auto resolved = commands_.Resolve("ardrone3", "Piloting", "PCMD",
                                    ArgShape::Pcmd);
  if (IsError(resolved)) {
    LogLookupError("ardrone3", "Piloting", "PCMD", GetError(resolved));
    return ActionResult::LookupFailed;
  }
  if (!IsConnected()) {
    return ActionResult::NotConnected;
  }
  return FromSendResult(
      platform_.SendPcmd(GetValue(resolved), pcmd, duration_s));
}

ActionResult BebopControl::Flip(std::string_view direction) {
  const std::string fixed = ToLower(direction);

  bool valid = false;
  for (auto d : kFlipDirections) {
    if (fixed == d) valid = true;
  }
  if (!valid) {
    platform_.Log(LogLevel::Error,
                  "Error: " + std::string(direction) +
                      " is not a valid direction. Must be one of front, "
                      "back, right, or left. Ignoring command");
    return ActionResult::InvalidArgument;
  }

  auto resolved =
      commands_.ResolveWithEnum("ardrone3", "Animations", "Flip", fixed);
  if (IsError(resolved)) {
    LogLookupError("ardrone3", "Animations", "Flip", GetError(resolved));
    return ActionResult::LookupFailed;
  }
  if (!IsConnected()) {
    return ActionResult::NotConnected;
  }
  const auto& cmd = GetValue(resolved);
  return FromSendResult(
      platform_.SendAckEnumCommand(cmd.descriptor, cmd.selector));
}

void BebopControl::LogLookupError(std::string_view domain,
                                  std::string_view klass,
                                  std::string_view command,
                                  LookupError err) const {
  platform_.Log(LogLevel::Error, "Cannot resolve " + std::string(domain) +
                                     "/" + std::string(klass) + "/" +
                                     std::string(command) + ": " +
                                     LookupErrorName(err));
}

// ─────────────────────────────────────────────────────────────────────────
// Safe-действия
// ─────────────────────────────────────────────────────────────────────────

void BebopControl::SafeTakeoff(uint32_t timeout_ms) {
  // Если аппарат уже в воздухе, повторять TakeOff незачем
  static constexpr SafeActionPlan kPlan{
      "takeoff", &BebopControl::TakeOff,
      StateBit(FlyingState::TakingOff) | StateBit(FlyingState::Flying) |
          StateBit(FlyingState::Hovering),
      StateBit(FlyingState::Flying) | StateBit(FlyingState::Hovering)};
  (void)RunSafeAction(kPlan, timeout_ms);
}

void BebopControl::SafeLand(uint32_t timeout_ms) {
  static constexpr SafeActionPlan kPlan{
      "land", &BebopControl::Land,
      StateBit(FlyingState::Landing) | StateBit(FlyingState::Landed),
      StateBit(FlyingState::Landed)};
  (void)RunSafeAction(kPlan, timeout_ms);
}

BebopControl::SafeActionOutcome BebopControl::RunSafeAction(
    const SafeActionPlan& plan, uint32_t timeout_ms) {
  const uint32_t start_ms = platform_.GetTimeMs();
  auto expired = [&]() {
    return platform_.GetTimeMs() - start_ms >= timeout_ms;
  };
  auto log = [&](LogLevel level, const char* what) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "safe %s: %s (state %s)", plan.name, what,
                  FlyingStateName(sensors_.GetFlyingState()));
    platform_.Log(level, buf);
  };

  // Этап 1: повторять команду, пока аппарат не начнёт переход
  while (!expired()) {
    const FlyingState state = sensors_.GetFlyingState();
    if (state == FlyingState::Emergency) {
      log(LogLevel::Warning, "aborted on emergency");
      return SafeActionOutcome::Emergency;
    }
    if (InMask(state, plan.started_mask)) break;

    log(LogLevel::Info, "sending command");
    // Неудачная отправка не ошибка: на следующей итерации повторим
    (void)(this->*plan.command)();
    platform_.SmartSleep(config_.poll_interval_ms);
  }

  // Этап 2: ждать завершения перехода без повторной отправки
  while (!expired()) {
    const FlyingState state = sensors_.GetFlyingState();
    if (state == FlyingState::Emergency) {
      log(LogLevel::Warning, "aborted on emergency");
      return SafeActionOutcome::Emergency;
    }
    if (InMask(state, plan.completed_mask)) {
      log(LogLevel::Info, "completed");
      return SafeActionOutcome::Completed;
    }
    platform_.SmartSleep(config_.poll_interval_ms);
  }

  log(LogLevel::Warning, "deadline reached");
  return SafeActionOutcome::Deadline;
}

void BebopControl::SmartSleep(uint32_t duration_ms) {
  platform_.SmartSleep(duration_ms);
}

}  // namespace bebop
