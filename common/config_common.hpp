#pragma once

// Общие параметры, не зависящие от конкретной платформы.
// Подключается из platform config.hpp.

// Период опроса в safe-циклах (takeoff/land), мс.
#ifndef SAFE_ACTION_POLL_INTERVAL_MS
#define SAFE_ACTION_POLL_INTERVAL_MS 1000
#endif

// Таймаут safe-действий по умолчанию, мс.
#ifndef SAFE_ACTION_DEFAULT_TIMEOUT_MS
#define SAFE_ACTION_DEFAULT_TIMEOUT_MS 10000
#endif

// Количество попыток соединения по умолчанию.
#ifndef CONNECT_DEFAULT_RETRIES
#define CONNECT_DEFAULT_RETRIES 3
#endif

// Предел по каждой оси PCMD (roll/pitch/yaw/vertical).
#ifndef PCMD_AXIS_LIMIT
#define PCMD_AXIS_LIMIT 100
#endif
