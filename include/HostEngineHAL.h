/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      include/HostEngineHAL.h
 * Description: Desktop implementation of IEngineHAL.
 * Monotonic clock plus the shared Logger.
 * =================================================================================
 */
#pragma once

#include <chrono>

#include "EngineContext.h"
#include "Types.h"

class HostEngineHAL : public IEngineHAL {
private:
  HostEngineHAL();

  std::chrono::steady_clock::time_point _bootTime;

public:
  static HostEngineHAL &getInstance();

  void initialize();

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);
  void printStartupDiagnostics();

  // --- IEngineHAL Implementation ---
  unsigned long getMillis() override;
};
