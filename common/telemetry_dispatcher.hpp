#pragma once

#include <atomic>
#include <cstdint>

#include "drone_platform.hpp"
#include "sensor_state_store.hpp"
#include "telemetry_decoder.hpp"

namespace bebop {

/**
 * @brief Приём телеметрии: пакет → события → SensorStateStore → ACK
 *
 * Для каждого входящего пакета:
 * 1. декодирует payload внешним кодеком;
 * 2. применяет события к хранилищу в порядке, выданном кодеком;
 *    событие без имени логируется (Warning) и пропускается;
 * 3. если пакет требует подтверждения, ровно один AckPacket() после
 *    применения всех событий пакета.
 */
class TelemetryDispatcher : public TelemetrySink {
 public:
  struct Stats {
    uint64_t packets{0};
    uint64_t events_applied{0};
    uint64_t events_missing_name{0};
    uint64_t acks_sent{0};
  };

  TelemetryDispatcher(DronePlatform& platform, TelemetryDecoder& decoder,
                      SensorStateStore& store) noexcept
      : platform_(platform), decoder_(decoder), store_(store) {}

  void OnTelemetryPacket(const TelemetryPacket& packet) override;

  /** Снимок счётчиков (можно вызывать из любого потока). */
  [[nodiscard]] Stats GetStats() const noexcept {
    return Stats{packets_.load(), events_applied_.load(),
                 events_missing_name_.load(), acks_sent_.load()};
  }

 private:
  DronePlatform& platform_;
  TelemetryDecoder& decoder_;
  SensorStateStore& store_;
  std::atomic<uint64_t> packets_{0};
  std::atomic<uint64_t> events_applied_{0};
  std::atomic<uint64_t> events_missing_name_{0};
  std::atomic<uint64_t> acks_sent_{0};
};

}  // namespace bebop
