/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      main.cpp
 * Description: Host entry point. Runs one operation against a scripted network.
 * =================================================================================
 */

#include <chrono>
#include <stdio.h>
#include <string.h>
#include <thread>

// --- Module Includes ---
#include "Config.h"
#include "HostEngineHAL.h"
#include "Logger.h"
#include "ScriptedTerminal.h"
#include "SettingsManager.h"
#include "TransactionJournal.h"

// --- Engine Includes ---
#include "UssdEngine.h"

// --- Dependencies ---
HostEngineHAL &hal = HostEngineHAL::getInstance();

struct CommandLine {
  const char *settingsPath;
  const char *credentialsPath;
  const char *scriptPath;
  const char *requestPath;
  const char *logPath;
  bool showHistory;
  bool writeSettings;

  CommandLine()
      : settingsPath(DEFAULT_SETTINGS_PATH), credentialsPath(DEFAULT_CREDENTIALS_PATH), scriptPath(nullptr),
        requestPath(nullptr), logPath(nullptr), showHistory(false), writeSettings(false) {}
};

// Collects what the engine reports for the one session this run starts.
class PilotListener : public IEngineListener {
public:
  PilotListener() : done(false), cancelled(false), turns(0) {}

  void onTurnText(SessionHandle handle, const std::string &text) override {
    (void)handle;
    (void)text;
    turns++;
  }

  void onOutcome(const Outcome &o) override {
    outcome = o;
    done = true;
  }

  void onCancelled(SessionHandle handle) override {
    (void)handle;
    cancelled = true;
    done = true;
  }

  bool done;
  bool cancelled;
  int turns;
  Outcome outcome;
};

/**
 * Prints program identity and build information.
 */
void printFirmwareDiagnostics() {
  char logBuf[128];

  hal.log(LOG_SEP_MAJOR);
  hal.log("                          USSD PILOT IDENTITY                             ");
  hal.log(LOG_SEP_MAJOR);

  hal.log("[ BUILD DETAILS ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device Name", DEVICE_NAME);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", __cplusplus);
  hal.log(logBuf);
  hal.log("");
}

static void printUsage() {
  printf("Usage:\n");
  printf("  ussd_pilot --script <script.json> --request <request.json>\n");
  printf("             [--settings <file>] [--credentials <file>] [--log <file>]\n");
  printf("  ussd_pilot --history [--settings <file>]\n");
  printf("  ussd_pilot --write-settings [--settings <file>]\n");
}

static bool parseCommandLine(int argc, char **argv, CommandLine &cmd) {
  for (int i = 1; i < argc; i++) {
    const char *arg = argv[i];
    bool hasValue = (i + 1) < argc;

    if (strcmp(arg, "--history") == 0) {
      cmd.showHistory = true;
    } else if (strcmp(arg, "--write-settings") == 0) {
      cmd.writeSettings = true;
    } else if (strcmp(arg, "--settings") == 0 && hasValue) {
      cmd.settingsPath = argv[++i];
    } else if (strcmp(arg, "--credentials") == 0 && hasValue) {
      cmd.credentialsPath = argv[++i];
    } else if (strcmp(arg, "--script") == 0 && hasValue) {
      cmd.scriptPath = argv[++i];
    } else if (strcmp(arg, "--request") == 0 && hasValue) {
      cmd.requestPath = argv[++i];
    } else if (strcmp(arg, "--log") == 0 && hasValue) {
      cmd.logPath = argv[++i];
    } else {
      return false;
    }
  }
  return cmd.showHistory || cmd.writeSettings || (cmd.scriptPath != nullptr && cmd.requestPath != nullptr);
}

static unsigned long long wallClockMs() {
  return (unsigned long long)std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static int configError(const char *what, const std::string &errorMsg) {
  char logBuf[MAX_LOG_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "%s: %s", what, errorMsg.c_str());
  hal.logKeyValue("Config", logBuf);
  flushLogQueue();
  return EXIT_CONFIG_ERROR;
}

// =================================================================
// --- History ---
// =================================================================

static int showHistory(const HostSettings &settings) {
  JsonDocument records;
  std::string errorMsg;
  if (!TransactionJournal::load(settings.journalPath.c_str(), records, errorMsg)) {
    return configError("Journal", errorMsg);
  }

  char logBuf[MAX_LOG_LENGTH];
  hal.log(LOG_SEP_MAJOR);
  snprintf(logBuf, sizeof(logBuf), " %-13s | %-8s | %12s | %-17s | %s", "TYPE", "STATUS", "AMOUNT", "CATEGORY",
           "REFERENCE");
  hal.log(logBuf);
  hal.log(LOG_SEP_MINOR);

  int count = 0;
  for (JsonObject r : records.as<JsonArray>()) {
    snprintf(logBuf, sizeof(logBuf), " %-13s | %-8s | %12.2f | %-17s | %s", r["type"] | "", r["status"] | "",
             r["amount"] | 0.0, r["category"] | "", r["reference_id"] | "");
    hal.log(logBuf);
    count++;
    processLogQueue();
  }

  hal.log(LOG_SEP_MINOR);
  snprintf(logBuf, sizeof(logBuf), " %d record(s) in %s", count, settings.journalPath.c_str());
  hal.log(logBuf);
  flushLogQueue();
  return EXIT_OUTCOME_SUCCESS;
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int main(int argc, char **argv) {
  CommandLine cmd;
  if (!parseCommandLine(argc, argv, cmd)) {
    printUsage();
    return EXIT_CONFIG_ERROR;
  }

  // 1. Initialize Host
  hal.initialize();
  printFirmwareDiagnostics();
  flushLogQueue();

  // 2. Load Settings
  HostSettings settings;
  std::string errorMsg;
  if (!SettingsManager::loadSettings(cmd.settingsPath, settings, errorMsg)) {
    return configError("Settings", errorMsg);
  }

  if (cmd.writeSettings) {
    // Writes the effective settings back, filling in every key.
    bool saved = SettingsManager::saveSettings(cmd.settingsPath, settings);
    flushLogQueue();
    return saved ? EXIT_OUTCOME_SUCCESS : EXIT_CONFIG_ERROR;
  }
  if (cmd.showHistory) return showHistory(settings);

  // 3. Load Credentials & Request
  UserCredentials creds;
  if (!SettingsManager::loadCredentials(cmd.credentialsPath, creds, errorMsg)) {
    return configError("Credentials", errorMsg);
  }

  JsonDocument requestDoc;
  bool missing = false;
  TransferRequest request;
  if (!SettingsManager::readJsonFile(cmd.requestPath, requestDoc, missing, errorMsg) ||
      !ConfigValidators::parseTransferRequest(requestDoc.as<JsonVariant>(), request, errorMsg) ||
      !ConfigValidators::validateTransfer(request, errorMsg)) {
    return configError("Request", errorMsg);
  }

  // 4. Build the Scripted Network
  JsonDocument scriptDoc;
  ScriptedTerminal terminal(hal);
  if (!SettingsManager::readJsonFile(cmd.scriptPath, scriptDoc, missing, errorMsg) ||
      !terminal.load(scriptDoc.as<JsonVariant>(), errorMsg)) {
    return configError("Script", errorMsg);
  }

  // 5. Initialize Engine
  PilotListener listener;
  UssdEngine engine(hal, terminal, terminal, terminal, listener, settings.timings, settings.shortCode.c_str(),
                    USSD_SOURCE_PACKAGES);

  if (!engine.validateTimings(settings.timings)) {
    return configError("Settings", "engine timings rejected");
  }

  terminal.setChangeCallback([&engine](const std::string &sourceId) { engine.onSnapshotChanged(sourceId); });

  // 6. Diagnostics
  hal.printStartupDiagnostics();
  flushLogQueue();
  engine.printStartupDiagnostics();
  flushLogQueue();
  hal.log(LOG_SEP_MAJOR);

  // 7. Start the Operation
  BankSecrets secrets = creds.toSecrets();
  SessionHandle handle = INVALID_SESSION_HANDLE;
  int status = STATUS_BAD_REQUEST;

  switch (request.kind) {
  case OP_BALANCE_CHECK:
    status = engine.startBalanceCheck(secrets, handle);
    break;
  case OP_SEND_MONEY:
    status = engine.startSendMoney(secrets, request.recipient, request.amount, request.remarks, handle);
    break;
  case OP_LINK_BANK:
    status = engine.startLinkBank(secrets, handle);
    break;
  }

  if (status == STATUS_BAD_REQUEST || status == STATUS_BUSY) {
    char codeBuf[16];
    snprintf(codeBuf, sizeof(codeBuf), "%d", status);
    return configError("Start", std::string("rejected with ") + codeBuf);
  }

  // 8. Main Loop. Runs past the Outcome until the dismiss timer has fired.
  while (!listener.done || engine.pendingTimers() > 0) {
    terminal.tick();
    engine.tick();
    processLogQueue();

    // The network dropped the dialog without a final message.
    if (!listener.done && terminal.isFinished() && !terminal.isDialogShowing()) {
      hal.logKeyValue("System", "Network released the session without a result");
      engine.cancel(handle);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(LOOP_INTERVAL_MS));
  }

  // 9. Record & Report
  int exitCode = EXIT_OUTCOME_FAILED;
  if (listener.cancelled) {
    listener.outcome.handle = handle;
    listener.outcome.kind = request.kind;
    listener.outcome.success = false;
    listener.outcome.finalMessage = "Session ended without a result";
    listener.outcome.hasBalance = false;
    listener.outcome.balance = 0.0;
  } else if (listener.outcome.success) {
    exitCode = EXIT_OUTCOME_SUCCESS;
  }

  TransactionJournal::append(settings.journalPath.c_str(), listener.outcome, request, wallClockMs());

  char logBuf[MAX_LOG_LENGTH];
  hal.log(LOG_SEP_MAJOR);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Operation", ConfigValidators::operationName(request.kind));
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Result", listener.outcome.success ? "SUCCESS" : "FAILED");
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %.120s", "Message", listener.outcome.finalMessage.c_str());
  hal.log(logBuf);
  if (!listener.outcome.referenceId.empty()) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Reference", listener.outcome.referenceId.c_str());
    hal.log(logBuf);
  }
  if (listener.outcome.hasBalance) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f", "Balance", listener.outcome.balance);
    hal.log(logBuf);
  }
  snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "Turns Seen", listener.turns);
  hal.log(logBuf);
  hal.log(LOG_SEP_MAJOR);
  flushLogQueue();

  if (cmd.logPath != nullptr && !writeLogHistory(cmd.logPath)) {
    fprintf(stderr, "Cannot write run log to %s\n", cmd.logPath);
  }

  return exitCode;
}
