#include "telemetry_dispatcher.hpp"

#include <cstdio>

namespace bebop {

void TelemetryDispatcher::OnTelemetryPacket(const TelemetryPacket& packet) {
  ++packets_;

  const auto events = decoder_.Decode(packet.payload);
  const EnumTable& enums = decoder_.Enums();

  for (const auto& event : events) {
    if (event.name) {
      (void)store_.Update(std::string_view(*event.name), event.value, enums);
      ++events_applied_;
      continue;
    }

    // Поля без описания ожидаемы: логируем и продолжаем разбор пакета
    ++events_missing_name_;
    char buf[96];
    std::snprintf(buf, sizeof(buf),
                  "data type %u buffer id %u sequence number %u",
                  static_cast<unsigned>(packet.data_type),
                  static_cast<unsigned>(packet.buffer_id),
                  static_cast<unsigned>(packet.sequence_number));
    platform_.Log(LogLevel::Warning, buf);
    platform_.Log(LogLevel::Warning,
                  "This sensor is missing (likely because we don't need it)");
  }

  // ACK подтверждает обработку, а не приём
  if (packet.ack_required) {
    platform_.AckPacket(packet.buffer_id, packet.sequence_number);
    ++acks_sent_;
  }
}

}  // namespace bebop
