#include "sensor_value.hpp"

#include <array>
#include <sstream>
#include <type_traits>

namespace bebop {

namespace {

struct LabelEntry {
  const char* label;
  FlyingState state;
};

constexpr std::array<LabelEntry, 9> kFlyingStateLabels{{
    {"landed", FlyingState::Landed},
    {"takingoff", FlyingState::TakingOff},
    {"hovering", FlyingState::Hovering},
    {"flying", FlyingState::Flying},
    {"landing", FlyingState::Landing},
    {"emergency", FlyingState::Emergency},
    {"usertakeoff", FlyingState::UserTakeoff},
    {"motor_ramping", FlyingState::MotorRamping},
    {"emergency_landing", FlyingState::EmergencyLanding},
}};

}  // namespace

std::string SensorValueToString(const SensorValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          std::ostringstream os;
          os << v;
          return os.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "'" + v + "'";
        } else if constexpr (std::is_same_v<T, EnumLabel>) {
          return v.label;
        } else {
          return "UNKNOWN_ENUM_VALUE";
        }
      },
      value);
}

std::string ScalarToString(const Scalar& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        return SensorValueToString(SensorValue(std::in_place_type<T>, v));
      },
      value);
}

FlyingState FlyingStateFromLabel(std::string_view label) noexcept {
  for (const auto& e : kFlyingStateLabels) {
    if (label == e.label) return e.state;
  }
  return FlyingState::Unknown;
}

const char* FlyingStateName(FlyingState state) noexcept {
  for (const auto& e : kFlyingStateLabels) {
    if (e.state == state) return e.label;
  }
  return "unknown";
}

}  // namespace bebop
