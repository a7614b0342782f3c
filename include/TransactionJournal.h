/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      include/TransactionJournal.h
 * Description:
 * Append-only transaction history. One JSON record per line.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>

#include "ConfigValidators.h"
#include "Types.h"

class TransactionJournal {
public:
  // Builds the record for one finished session and appends it to 'path'.
  static bool append(const char *path, const Outcome &outcome, const TransferRequest &request,
                     unsigned long long timestampMs);

  // Loads every record into 'outRecords' (a JSON array), oldest first.
  // A missing journal is an empty history. Malformed lines are an error.
  static bool load(const char *path, JsonDocument &outRecords, std::string &errorMsg);

private:
  static void log(const char *key, const char *value);
};
