/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      src/TransactionJournal.cpp
 * =================================================================================
 */
#include "TransactionJournal.h"

#include <fstream>
#include <stdio.h>

#include "HostEngineHAL.h"
#include "TransactionRecord.h"

void TransactionJournal::log(const char *key, const char *val) { HostEngineHAL::getInstance().logKeyValue(key, val); }

bool TransactionJournal::append(const char *path, const Outcome &outcome, const TransferRequest &request,
                                unsigned long long timestampMs) {
  JsonDocument doc;
  TransactionRecord::build(outcome, request, timestampMs, doc.to<JsonObject>());

  std::ofstream file(path, std::ios::out | std::ios::app);
  if (!file.is_open()) {
    log("Journal", "Append failed (cannot open file)");
    return false;
  }
  serializeJson(doc, file);
  file << '\n';

  if (!file.good()) {
    log("Journal", "Append failed (write error)");
    return false;
  }

  char logBuf[96];
  snprintf(logBuf, sizeof(logBuf), "%s %s recorded", TransactionRecord::typeName(outcome.kind),
           outcome.success ? "success" : "failure");
  log("Journal", logBuf);
  return true;
}

bool TransactionJournal::load(const char *path, JsonDocument &outRecords, std::string &errorMsg) {
  JsonArray records = outRecords.to<JsonArray>();

  std::ifstream file(path);
  if (!file.is_open()) return true;

  std::string line;
  int lineNo = 0;
  while (std::getline(file, line)) {
    lineNo++;
    if (line.empty()) continue;

    JsonDocument entry;
    DeserializationError error = deserializeJson(entry, line);
    if (error) {
      errorMsg = std::string(path) + ":" + std::to_string(lineNo) + ": " + error.c_str();
      return false;
    }
    records.add(entry.as<JsonObject>());
  }
  return true;
}
