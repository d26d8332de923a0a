#ifndef FLOODWATCHR_H
#define FLOODWATCHR_H

#include "config/settings.h"
#include "config/monitor_config.h"
#include "config/config_file.h"
#include "core/system.h"
#include "log/log.h"
#include "sensors/ultrasonic.h"
#include "audio/buzzer_player.h"
#include "mqtt/mqtt_client.h"
#include "monitor/monitor_loop.h"

#endif // FLOODWATCHR_H
