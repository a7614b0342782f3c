/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for host configuration and the credential store.
 * - Manages all settings-file interactions (JSON on disk).
 * - Validates inputs through ConfigValidators before anything reaches the engine.
 * =================================================================================
 */
#pragma once
#include <string>

#include "ConfigValidators.h"
#include "Types.h"

struct HostSettings {
  EngineTimings timings;
  std::string shortCode;
  std::string journalPath;
};

class SettingsManager {
public:
  // --- Engine / Host Settings ---
  // A missing file is not an error: defaults are returned.
  static bool loadSettings(const char *path, HostSettings &out, std::string &errorMsg);
  static bool saveSettings(const char *path, const HostSettings &settings);
  static HostSettings defaultSettings();

  // --- Credential Store ---
  // A missing file IS an error: nothing can be sent without credentials.
  static bool loadCredentials(const char *path, UserCredentials &out, std::string &errorMsg);
  static bool saveCredentials(const char *path, const UserCredentials &creds);

  // --- Raw Documents (scripts, requests) ---
  static bool readJsonFile(const char *path, JsonDocument &doc, bool &outMissing, std::string &errorMsg);

private:
  static bool writeJsonFile(const char *path, const JsonDocument &doc);
  static void log(const char *key, const char *value);
};
