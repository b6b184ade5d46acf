#pragma once

// Конфигурация симулятора Bebop (хост). Общие параметры в config_common.hpp.

// Шаг модели внутри SmartSleep, мс.
#define SIM_TICK_MS 50

// Задержка реакции аппарата на TakeOff / Landing, мс.
#define SIM_COMMAND_LATENCY_MS 300

// Длительность фазы takingoff до hovering, мс.
#define SIM_TAKEOFF_DURATION_MS 2500

// Длительность фазы landing до landed, мс.
#define SIM_LANDING_DURATION_MS 3000

// Стоимость одной попытки соединения, мс.
#define SIM_CONNECT_ATTEMPT_MS 200

// Буферы ARNetwork: события с ACK и без.
#define SIM_BUFFER_EVENT_ACK 126
#define SIM_BUFFER_EVENT_NOACK 127

// Типы кадров ARNetworkAL.
#define SIM_DATA_TYPE_DATA 2
#define SIM_DATA_TYPE_DATA_WITH_ACK 4

#include "config_common.hpp"
