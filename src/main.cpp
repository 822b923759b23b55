/*
 * botlink Firmware - Main Entry Point
 *
 * ELEGOO UNO R3 + SmartCar-Shield-v1.1 (TB6612FNG)
 * Arduino UNO Platform (ATmega328P)
 *
 * Line command protocol on the USB/BLE UART, dialect chosen at boot by
 * BOOT_PROFILE_JSON (see config.h and config/profile_config.h).
 *
 * SCHEDULER TASKS:
 *   rx     - 1 ms    (drain UART into the engine, flush pending TX)
 *   pump   - 10 ms   (dispatcher completion / next queued command)
 *   timer  - 100 ms  (GO expiry)
 *   telem  - profile telemetry_ms (periodic telemetry, skipped when 0)
 *   diag   - 5 s     (counters to the log, verbose builds only)
 */

#include <Arduino.h>
#include <avr/wdt.h>

#include "config.h"
#include "pins.h"

#include "core/log.h"
#include "core/scheduler.h"
#include "hal/smartcar_actuator.h"
#include "serial/serial_transport.h"
#include "engine/protocol_engine.h"
#include "config/profile_config.h"

// Global instances
SmartCarActuator actuator;
SerialTransport serialTransport;
ProtocolEngine engine;
Scheduler scheduler;

static void feedWatchdog() {
  wdt_reset();
}

#if ENABLE_DEBUG_LOG
// Shares the command UART: only enable on a bench, never with a host attached
static void serialLogSink(LogLevel level, const char* tag, const char* message) {
  char line[REPLY_MAX_LENGTH + 16];
  snprintf(line, sizeof(line), "[%s] %s: %s\n", tag, logLevelName(level), message);
  serialTransport.sendLine(line);
}
#endif

// Task: Protocol RX (1ms interval)
void task_protocol_rx() {
  serialTransport.flushPending();
  engine.pollTransport(millis());
}

// Task: Dispatcher pump
void task_dispatch_pump() {
  engine.pumpDispatcher(millis());
}

// Task: Timed action supervision
void task_timer() {
  engine.tickTimer(millis());
}

// Task: Periodic telemetry
void task_telemetry() {
  engine.tickTelemetry(millis());
}

// Task: Diagnostics
void task_diagnostics() {
  char buffer[REPLY_MAX_LENGTH];
  if (ProfileConfig::formatStats(engine.stats(), buffer, sizeof(buffer)) > 0) {
    LOG_V("DIAG", "%s", buffer);
  }
}

static Profile loadBootProfile() {
  Profile profile = profileC();
  ConfigError err = ProfileConfig::load(BOOT_PROFILE_JSON, profile);
  if (err != CONFIG_OK) {
    LOG_E("CFG", "boot profile rejected (%s), using C", ProfileConfig::errorName(err));
  }
  return profile;
}

void setup() {
  Serial.begin(SERIAL_BAUD);

#if ENABLE_DEBUG_LOG
  logSetSink(serialLogSink);
#endif

  actuator.init();
  actuator.setIdleHook(feedWatchdog);
  serialTransport.init(&Serial, feedWatchdog);

  Profile profile = loadBootProfile();
  actuator.setBlockingTone(profile.tone == TONE_BLOCKING);

  engine.init(&actuator, &serialTransport);
  engine.configure(profile);

  scheduler.init(feedWatchdog);
  scheduler.registerTask(task_protocol_rx, TASK_PROTOCOL_RX_MS, "rx");
  scheduler.registerTask(task_dispatch_pump, DISPATCH_PUMP_MS, "pump");
  scheduler.registerTask(task_timer, TIMER_TICK_MS, "timer");
  uint32_t telemetryMs = engine.getTelemetryTaskMs();
  if (telemetryMs > 0) {
    scheduler.registerTask(task_telemetry, telemetryMs, "telem");
  }
#if ENABLE_VERBOSE_LOGS
  scheduler.registerTask(task_diagnostics, TASK_DIAGNOSTICS_MS, "diag");
#endif

  wdt_enable(WDTO_2S);
  wdt_reset();

  LOG_I("MAIN", "botlink %s profile %c", FW_VERSION_STRING, profile.name);
  engine.begin(millis());
}

void loop() {
  wdt_reset();

  scheduler.run(millis());

  serialTransport.flushPending();
}
