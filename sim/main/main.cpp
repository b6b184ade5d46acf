#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "bebop_control.hpp"
#include "config.hpp"
#include "controller_config.hpp"
#include "drone_platform_sim.hpp"
#include "json_telemetry_codec.hpp"

using namespace bebop;

static const char *TAG = "main";

/** Конфигурация из файла (argv[1]) или значения по умолчанию. */
static ControllerConfig LoadConfig(int argc, char **argv) {
  if (argc < 2) return ControllerConfig{};

  std::ifstream in(argv[1]);
  if (!in) {
    printf("[%s] WARN: cannot open %s, using defaults\n", TAG, argv[1]);
    return ControllerConfig{};
  }
  std::stringstream ss;
  ss << in.rdbuf();

  auto config = ControllerConfigFromJson(ss.str());
  if (!config) {
    printf("[%s] WARN: %s is not a JSON object, using defaults\n", TAG,
           argv[1]);
    return ControllerConfig{};
  }
  printf("[%s] Config loaded: %s\n", TAG,
         ControllerConfigToJson(*config).c_str());
  return *config;
}

int main(int argc, char **argv) {
  printf("[%s] Bebop simulator starting...\n", TAG);

  const ControllerConfig config = LoadConfig(argc, argv);

  sim::DronePlatformSim platform;
  sim::JsonTelemetryDecoder decoder(EnumTable::Builtin());
  BebopControl bebop(platform, CommandTable::Builtin(), decoder, config);

  if (!bebop.Connect()) {
    printf("[%s] ERROR: Failed to connect\n", TAG);
    return 1;
  }

  if (bebop.AskForStateUpdate() != ActionResult::Sent) {
    printf("[%s] WARN: state request was not acknowledged\n", TAG);
  }
  bebop.SmartSleep(2000);
  printf("[%s] %s\n", TAG, bebop.Sensors().ToString().c_str());

  bebop.SafeTakeoff(bebop.GetConfig().default_safe_timeout_ms);
  printf("[%s] After takeoff: %s\n", TAG,
         FlyingStateName(bebop.Sensors().GetFlyingState()));

  // Значения вне диапазона ограничиваются, а не отвергаются
  const ActionResult fly = bebop.FlyDirect(0, 150, 0, -20, 1.0);
  printf("[%s] FlyDirect: %s\n", TAG, ActionResultName(fly));
  bebop.SmartSleep(2000);

  printf("[%s] Flip(Left): %s\n", TAG, ActionResultName(bebop.Flip("Left")));
  printf("[%s] Flip(UP): %s\n", TAG, ActionResultName(bebop.Flip("UP")));
  bebop.SmartSleep(1000);

  bebop.SafeLand(bebop.GetConfig().default_safe_timeout_ms);
  printf("[%s] After landing: %s\n", TAG,
         FlyingStateName(bebop.Sensors().GetFlyingState()));

  const auto stats = bebop.GetTelemetryStats();
  printf("[%s] Telemetry: %llu packets, %llu events, %llu acks\n", TAG,
         static_cast<unsigned long long>(stats.packets),
         static_cast<unsigned long long>(stats.events_applied),
         static_cast<unsigned long long>(stats.acks_sent));
  printf("[%s] %s\n", TAG, bebop.Sensors().ToString().c_str());

  bebop.Disconnect();
  return 0;
}
