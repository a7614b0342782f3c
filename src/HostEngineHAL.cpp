/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      src/HostEngineHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Host-side hardware abstraction: wall-independent milliseconds since start and
 * log routing into the ring buffer / console queue.
 * =================================================================================
 */
#include "HostEngineHAL.h"

#include <stdio.h>

#include "Config.h"
#include "Logger.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

HostEngineHAL::HostEngineHAL() : _bootTime(std::chrono::steady_clock::now()) {}

HostEngineHAL &HostEngineHAL::getInstance() {
  static HostEngineHAL instance;
  return instance;
}

void HostEngineHAL::initialize() {
  _bootTime = std::chrono::steady_clock::now();
  logKeyValue("System", "Host HAL ready");
}

// =================================================================================
// SECTION: LOGGING
// =================================================================================

void HostEngineHAL::log(const char *message) { logMessage(message); }

void HostEngineHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

void HostEngineHAL::printStartupDiagnostics() {
  char logBuf[128];

  log(LOG_SEP_MAJOR);
  log("                             HOST DIAGNOSTICS                             ");
  log(LOG_SEP_MAJOR);

  log("[ HOST ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device", DEVICE_NAME);
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %d ms", "Loop Interval", LOOP_INTERVAL_MS);
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %lu ms", "Uptime", getMillis());
  log(logBuf);

#ifdef DEBUG_MODE
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build", "DEBUG");
#else
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build", "RELEASE");
#endif
  log(logBuf);
  log("");
}

// =================================================================================
// SECTION: TIME
// =================================================================================

unsigned long HostEngineHAL::getMillis() {
  std::chrono::steady_clock::duration elapsed = std::chrono::steady_clock::now() - _bootTime;
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}
