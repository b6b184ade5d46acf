#include "sensor_state_store.hpp"

#include <type_traits>
#include <utility>
#include <vector>

namespace bebop {

namespace {

/** Разрешение enum-индекса; nullopt, если индекс отсутствует или вне диапазона. */
std::optional<std::string> ResolveEnumLabel(
    const std::optional<Scalar>& value,
    const std::vector<std::string>& labels) {
  if (!value || !std::holds_alternative<int64_t>(*value)) return std::nullopt;
  const int64_t index = std::get<int64_t>(*value);
  if (index < 0 || static_cast<uint64_t>(index) >= labels.size()) {
    return std::nullopt;
  }
  return labels[static_cast<size_t>(index)];
}

FlyingState FlyingStateFromValue(const SensorValue& value) {
  if (const auto* label = std::get_if<EnumLabel>(&value)) {
    return FlyingStateFromLabel(label->label);
  }
  // Поле пришло строкой, если таблица перечислений его не объявила
  if (const auto* str = std::get_if<std::string>(&value)) {
    return FlyingStateFromLabel(*str);
  }
  return FlyingState::Unknown;
}

SensorValue FromScalar(Scalar scalar) {
  return std::visit(
      [](auto&& v) -> SensorValue {
        using T = std::decay_t<decltype(v)>;
        return SensorValue(std::in_place_type<T>, std::forward<decltype(v)>(v));
      },
      std::move(scalar));
}

}  // namespace

UpdateResult SensorStateStore::Update(std::optional<std::string_view> name,
                                      const std::optional<Scalar>& value,
                                      const EnumTable& enums) {
  if (!name) {
    Warn("Error empty sensor");
    return UpdateResult::MissingName;
  }

  SensorValue resolved;
  UpdateResult result = UpdateResult::Stored;

  if (const auto* labels = enums.Find(*name)) {
    auto label = ResolveEnumLabel(value, *labels);
    if (label) {
      resolved = EnumLabel{std::move(*label)};
    } else {
      resolved = UnknownEnum{};
      result = UpdateResult::StoredUnknownEnum;
      Warn("Unresolved enum value for " + std::string(*name) + ": " +
           (value ? ScalarToString(*value) : std::string("<none>")));
    }
  } else {
    if (!value) {
      Warn("Sensor " + std::string(*name) + " has no value");
      return UpdateResult::MissingValue;
    }
    resolved = FromScalar(*value);
  }

  std::lock_guard<std::mutex> lock(mutex_);

  // Сначала поле, потом производные флаги
  auto it = sensors_.find(*name);
  if (it == sensors_.end()) {
    it = sensors_.emplace(std::string(*name), std::move(resolved)).first;
  } else {
    it->second = std::move(resolved);
  }

  if (*name == FLYING_STATE_FIELD) {
    flying_state_ = FlyingStateFromValue(it->second);
  }
  if (*name == MOVE_BY_END_FIELD) {
    relative_move_ended_ = true;
  }
  if (*name == CAMERA_ORIENTATION_FIELD) {
    camera_move_ended_ = true;
  }

  return result;
}

std::optional<SensorValue> SensorStateStore::Get(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sensors_.find(name);
  if (it == sensors_.end()) return std::nullopt;
  return it->second;
}

FlyingState SensorStateStore::GetFlyingState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return flying_state_;
}

bool SensorStateStore::IsRelativeMoveEnded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return relative_move_ended_;
}

bool SensorStateStore::IsCameraMoveEnded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return camera_move_ended_;
}

std::map<std::string, SensorValue, std::less<>> SensorStateStore::Snapshot()
    const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sensors_;
}

size_t SensorStateStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sensors_.size();
}

std::string SensorStateStore::ToString() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string out = "Bebop sensors: {";
  bool first = true;
  for (const auto& [name, value] : sensors_) {
    if (!first) out += ", ";
    first = false;
    out += "'" + name + "': " + SensorValueToString(value);
  }
  out += "}";
  return out;
}

void SensorStateStore::Warn(const std::string& msg) const {
  if (log_) log_->Log(LogLevel::Warning, msg);
}

}  // namespace bebop
