/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration loading, validation and saving.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Config.h"
#include "HostEngineHAL.h" // For logging
#include <fstream>
#include <stdio.h>

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { HostEngineHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: FILE HELPERS
// =================================================================================

bool SettingsManager::readJsonFile(const char *path, JsonDocument &doc, bool &outMissing, std::string &errorMsg) {
  outMissing = false;

  std::ifstream file(path);
  if (!file.is_open()) {
    outMissing = true;
    errorMsg = std::string("Cannot open ") + path;
    return false;
  }

  DeserializationError error = deserializeJson(doc, file);
  if (error) {
    errorMsg = std::string(path) + ": " + error.c_str();
    return false;
  }
  return true;
}

bool SettingsManager::writeJsonFile(const char *path, const JsonDocument &doc) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    log("Settings", "Write failed (cannot open file)");
    return false;
  }
  serializeJsonPretty(doc, file);
  file << '\n';
  return file.good();
}

// =================================================================================
// SECTION: ENGINE / HOST SETTINGS
// =================================================================================

HostSettings SettingsManager::defaultSettings() {
  HostSettings s;
  s.timings = DEFAULT_ENGINE_TIMINGS;
  s.shortCode = USSD_SHORT_CODE;
  s.journalPath = DEFAULT_JOURNAL_PATH;
  return s;
}

bool SettingsManager::loadSettings(const char *path, HostSettings &out, std::string &errorMsg) {
  HostSettings s = defaultSettings();

  JsonDocument doc;
  bool missing = false;
  if (!readJsonFile(path, doc, missing, errorMsg)) {
    if (missing) {
      log("Settings", "No settings file, using defaults");
      errorMsg.clear();
      out = s;
      return true;
    }
    return false;
  }

  if (!ConfigValidators::parseEngineTimings(doc["engine"], DEFAULT_ENGINE_TIMINGS, s.timings, errorMsg)) {
    return false;
  }

  std::string shortCode = doc["shortCode"] | USSD_SHORT_CODE;
  if (shortCode.empty() || shortCode[shortCode.size() - 1] != '#') {
    errorMsg = "shortCode must end with '#'.";
    return false;
  }
  s.shortCode = shortCode;
  s.journalPath = doc["journalPath"] | DEFAULT_JOURNAL_PATH;

  char logBuf[96];
  snprintf(logBuf, sizeof(logBuf), "Loaded %s", path);
  log("Settings", logBuf);

  out = s;
  return true;
}

bool SettingsManager::saveSettings(const char *path, const HostSettings &settings) {
  JsonDocument doc;
  ConfigValidators::writeEngineTimings(settings.timings, doc["engine"].to<JsonObject>());
  doc["shortCode"] = settings.shortCode;
  doc["journalPath"] = settings.journalPath;

  bool ok = writeJsonFile(path, doc);
  log("Settings", ok ? "Settings saved" : "Settings NOT saved");
  return ok;
}

// =================================================================================
// SECTION: CREDENTIAL STORE
// =================================================================================

bool SettingsManager::loadCredentials(const char *path, UserCredentials &out, std::string &errorMsg) {
  JsonDocument doc;
  bool missing = false;
  if (!readJsonFile(path, doc, missing, errorMsg)) {
    return false;
  }

  UserCredentials creds;
  if (!ConfigValidators::parseCredentials(doc, creds, errorMsg)) return false;
  if (!ConfigValidators::validateCredentials(creds, errorMsg)) return false;

  // Never log the PIN or card. The bank is enough to tell profiles apart.
  log("Creds", creds.bankName.c_str());

  out = creds;
  return true;
}

bool SettingsManager::saveCredentials(const char *path, const UserCredentials &creds) {
  JsonDocument doc;
  ConfigValidators::writeCredentials(creds, doc.to<JsonObject>());

  bool ok = writeJsonFile(path, doc);
  log("Creds", ok ? "Credentials saved" : "Credentials NOT saved");
  return ok;
}
