/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/UssdEngine.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Drives one USSD session at a time through the
 * classify -> stabilize -> plan -> inject -> extract pipeline.
 * =================================================================================
 */
#include <stdio.h>

#include "UssdEngine.h"
#include "BankCatalog.h"
#include "OutcomeExtractor.h"
#include "ResponsePlanner.h"
#include "SnapshotClassifier.h"
#include "TextUtils.h"

static const char* const DIAL_FAILED_MESSAGE = "Failed to initiate USSD session";
static const char* const TIMEOUT_MESSAGE = "Session timed out waiting for network response";

// Whole units only. Anything above this is not a realistic USSD transfer.
static const double MAX_TRANSFER_AMOUNT = 1000000000.0;

static void resetProgress(SessionProgress& progress) {
    progress.menuSelected = false;
    progress.paymentMethodSelected = false;
    progress.pinSent = false;
    progress.bankSent = false;
    progress.cardSent = false;
    progress.recipientSent = false;
    progress.amountSent = false;
    progress.remarksSent = false;
    progress.stepCounter = 0;
}

// =================================================================================
// SECTION: LIFECYCLE & CONSTRUCTOR
// =================================================================================

UssdEngine::UssdEngine(IEngineHAL& hal,
                       ISnapshotSource& snapshots,
                       IInputActuator& actuator,
                       IDialer& dialer,
                       IEngineListener& listener,
                       const EngineTimings& timings,
                       const char* shortCode,
                       const char* const* allowedSources)
    : _hal(hal),
      _snapshots(snapshots),
      _actuator(actuator),
      _dialer(dialer),
      _listener(listener),
      _timings(timings),
      _shortCode(shortCode ? shortCode : ""),
      _hasSession(false),
      _nextHandle(1),
      _scheduler(hal),
      _tracker(_state, _timings),
      _injector(hal, snapshots, actuator, _scheduler, _tracker, _timings),
      _activeFlag(false),
      _activeHandle(INVALID_SESSION_HANDLE),
      _lastResponded(0)
{
    if (allowedSources) {
        for (size_t i = 0; allowedSources[i] != NULL; i++) {
            _allowedSources.push_back(allowedSources[i]);
        }
    }

    _session.handle = INVALID_SESSION_HANDLE;
    _session.kind = OP_BALANCE_CHECK;
    resetProgress(_session.progress);
}

void UssdEngine::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void UssdEngine::publishState() {
    _activeFlag.store(_hasSession);
    _activeHandle.store(_hasSession ? _session.handle : INVALID_SESSION_HANDLE);
    _lastResponded.store(_state.lastRespondedFingerprint);
}

/**
 * Main loop tick. Runs every due timer callback on the caller's thread.
 */
void UssdEngine::tick() {
    _scheduler.runDue();
    publishState();
}

void UssdEngine::printStartupDiagnostics() {
    char logBuf[128];

    _hal.log("==========================================================================");
    _hal.log("                         USSD ENGINE DIAGNOSTICS                          ");
    _hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _hal.log("[ ENGINE STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Active Session",
             _hasSession ? kindToString(_session.kind) : "NONE");
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Short Code", _shortCode.c_str());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Pending Timers", (unsigned)_scheduler.pendingCount());
    _hal.log(logBuf);
    for (int i = 0; i < TIMER_CATEGORY_COUNT; i++) {
        if (!_scheduler.isPending((TimerCategory)i)) continue;
        snprintf(logBuf, sizeof(logBuf), "   - %s", timerToString((TimerCategory)i));
        _hal.log(logBuf);
    }

    // -------------------------------------------------------------------------
    // SECTION: CONFIGURATION STATUS
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ CONFIGURATION STATUS ]");

    bool timingsValid = validateTimings(_timings);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Self-Check", timingsValid ? "PASS" : "FAIL (INVALID TIMINGS)");
    _hal.log(logBuf);

    if (!timingsValid) {
        _hal.log(" WARNING: Responses may be sent before the dialog has settled.");
    }

    // -------------------------------------------------------------------------
    // SECTION: TIMINGS
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ TIMINGS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Event Debounce", _timings.eventDebounceMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Stabilize", _timings.stabilizeMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Text Injection Delay", _timings.textInjectionDelayMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Post-Send Cooldown", _timings.postSendCooldownMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms (+%u)", "Min Send Interval",
             _timings.minSendIntervalMs, _timings.sendRetrySlackMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Focus Retry", _timings.focusRetryMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Dismiss Delay", _timings.dismissDelayMs);
    _hal.log(logBuf);

    if (_timings.sessionTimeoutMs > 0) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Session Timeout", _timings.sessionTimeoutMs);
    } else {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Session Timeout", "DISABLED");
    }
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: SOURCES
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ EVENT SOURCES ]");

    if (_allowedSources.empty()) {
        _hal.log(" (any source)");
    }
    for (size_t i = 0; i < _allowedSources.size(); i++) {
        snprintf(logBuf, sizeof(logBuf), " - %s", _allowedSources[i].c_str());
        _hal.log(logBuf);
    }

    size_t bankCount = 0;
    BankCatalog::all(bankCount);
    _hal.log("");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Supported Banks", (unsigned)bankCount);
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: VALIDATION
// =================================================================================

bool UssdEngine::validateTimings(const EngineTimings& timings) const {
    if (timings.stabilizeMs == 0) return false;
    if (timings.textInjectionDelayMs == 0) return false;
    if (timings.minSendIntervalMs == 0) return false;
    // Debounce must not swallow the whole settle window.
    if (timings.eventDebounceMs >= timings.stabilizeMs) return false;
    if (timings.maxMessageLength < 16) return false;
    return true;
}

bool UssdEngine::validateRequest(OperationKind kind, const BankSecrets& secrets,
                                 const TransferParams& transfer, std::string& errorMsg) const {
    if (kind == OP_LINK_BANK) {
        if (TextUtils::isBlank(secrets.bankIfsc) && TextUtils::isBlank(secrets.bankName)) {
            errorMsg = "Bank IFSC or bank name is required.";
            return false;
        }
        if (TextUtils::isBlank(secrets.cardDetails)) {
            errorMsg = "Card details are required.";
            return false;
        }
        return true;
    }

    if (TextUtils::isBlank(secrets.upiPin)) {
        errorMsg = "UPI PIN is required.";
        return false;
    }

    if (kind == OP_SEND_MONEY) {
        if (TextUtils::isBlank(transfer.recipient)) {
            errorMsg = "Recipient is required.";
            return false;
        }
        if (!TextUtils::isAllDigits(transfer.amount) || transfer.amount == "0") {
            errorMsg = "Amount must be a positive whole number.";
            return false;
        }
    }
    return true;
}

// =================================================================================
// SECTION: API COMMANDS
// =================================================================================

int UssdEngine::startBalanceCheck(const BankSecrets& secrets, SessionHandle& outHandle) {
    TransferParams none;
    return beginSession(OP_BALANCE_CHECK, secrets, none, outHandle);
}

int UssdEngine::startSendMoney(const BankSecrets& secrets,
                               const std::string& recipient,
                               double amount,
                               const std::string& remarks,
                               SessionHandle& outHandle) {
    outHandle = INVALID_SESSION_HANDLE;

    // The network only takes whole units. Fractions are dropped.
    if (!(amount >= 1.0) || amount > MAX_TRANSFER_AMOUNT) {
        logKeyValue("Start", "REJECTED (amount out of range)");
        return STATUS_BAD_REQUEST;
    }

    char amountBuf[24];
    snprintf(amountBuf, sizeof(amountBuf), "%lld", (long long)amount);

    TransferParams transfer;
    transfer.recipient = TextUtils::trim(recipient);
    transfer.amount = amountBuf;
    transfer.remarks = TextUtils::isBlank(remarks) ? std::string(DEFAULT_REMARKS) : remarks;

    return beginSession(OP_SEND_MONEY, secrets, transfer, outHandle);
}

int UssdEngine::startLinkBank(const BankSecrets& secrets, SessionHandle& outHandle) {
    TransferParams none;
    return beginSession(OP_LINK_BANK, secrets, none, outHandle);
}

bool UssdEngine::cancel(SessionHandle handle) {
    if (!_hasSession || handle != _session.handle) {
        logKeyValue("Cancel", "IGNORED (not the active session)");
        return false;
    }

    clearSession();
    publishState();
    logKeyValue("Cancel", "Session cancelled");

    _listener.onCancelled(handle);
    return true;
}

// =================================================================================
// SECTION: SESSION LIFECYCLE
// =================================================================================

int UssdEngine::beginSession(OperationKind kind, const BankSecrets& secrets,
                             const TransferParams& transfer, SessionHandle& outHandle) {
    outHandle = INVALID_SESSION_HANDLE;

    // Single session. A start while a response is still being typed into the
    // previous dialog would race it, so that is rejected as well.
    if (_hasSession || _state.isSubmitting || _injector.isBusy()) {
        logKeyValue("Start", "REJECTED (busy)");
        return STATUS_BUSY;
    }

    std::string errorMsg;
    if (!validateRequest(kind, secrets, transfer, errorMsg)) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "REJECTED (%s)", errorMsg.c_str());
        logKeyValue("Start", logBuf);
        return STATUS_BAD_REQUEST;
    }

    // Fresh dedup state. Nothing from a previous session may leak in.
    _scheduler.cancelAll();
    _tracker.reset();
    _injector.reset();

    _session.handle = _nextHandle++;
    if (_nextHandle == INVALID_SESSION_HANDLE) _nextHandle = 1;
    _session.kind = kind;
    _session.secrets = secrets;
    _session.transfer = transfer;
    resetProgress(_session.progress);
    _hasSession = true;
    outHandle = _session.handle;

    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "%s (#%u)", kindToString(kind), (unsigned)_session.handle);
    logKeyValue("Start", logBuf);

    if (kind == OP_SEND_MONEY) {
        snprintf(logBuf, sizeof(logBuf), "%s, amount %s",
                 TextUtils::mask(transfer.recipient, 4).c_str(), transfer.amount.c_str());
        logKeyValue("Transfer", logBuf);
    }
    const BankInfo* bank = BankCatalog::findByIfsc(secrets.bankIfsc);
    if (!bank) bank = BankCatalog::findByName(secrets.bankName);
    if (bank) {
        snprintf(logBuf, sizeof(logBuf), "%s (%s)", bank->name, bank->shortCode);
    } else {
        snprintf(logBuf, sizeof(logBuf), "%s (not in catalog)", ResponsePlanner::bankInput(secrets).c_str());
    }
    logKeyValue("Bank", logBuf);

    armSessionTimeout();
    publishState();

    if (!_dialer.dial(_shortCode.c_str())) {
        logKeyValue("Dial", "FAILED");
        finishSession(false, DIAL_FAILED_MESSAGE);
        return STATUS_DIAL_FAILED;
    }

    logKeyValue("Dial", _shortCode.c_str());
    return STATUS_STARTED;
}

void UssdEngine::finishSession(bool success, const std::string& message) {
    if (!_hasSession) return;

    Outcome outcome = OutcomeExtractor::buildOutcome(_session, success, message, _timings.maxMessageLength);

    logKeyValue("Outcome", success ? "SUCCESS" : "FAILED");
    if (!outcome.referenceId.empty()) {
        logKeyValue("Ref", outcome.referenceId.c_str());
    }
    if (outcome.hasBalance) {
        char balanceBuf[32];
        snprintf(balanceBuf, sizeof(balanceBuf), "%.2f", outcome.balance);
        logKeyValue("Balance", balanceBuf);
    }

    clearSession();

    if (success && _timings.dismissDelayMs > 0) {
        _scheduler.schedule(TIMER_DISMISS, _timings.dismissDelayMs, [this]() { _injector.dismissDialog(); });
    }

    publishState();
    _listener.onOutcome(outcome);
}

void UssdEngine::clearSession() {
    _hasSession = false;

    _session.secrets = BankSecrets();
    _session.transfer = TransferParams();
    resetProgress(_session.progress);

    _scheduler.cancelAll();
    _tracker.reset();
    _injector.reset();
}

void UssdEngine::armSessionTimeout() {
    if (_timings.sessionTimeoutMs == 0) return;

    SessionHandle handle = _session.handle;
    _scheduler.schedule(TIMER_SESSION_TIMEOUT, _timings.sessionTimeoutMs,
                        [this, handle]() { onSessionTimeout(handle); });
}

void UssdEngine::onSessionTimeout(SessionHandle handle) {
    if (!_hasSession || _session.handle != handle) return;

    logKeyValue("Timeout", "No network response");
    finishSession(false, TIMEOUT_MESSAGE);
}

// =================================================================================
// SECTION: TURN PROCESSING
// =================================================================================

bool UssdEngine::isAllowedSource(const std::string& sourceId) const {
    if (_allowedSources.empty()) return true;
    for (size_t i = 0; i < _allowedSources.size(); i++) {
        if (_allowedSources[i] == sourceId) return true;
    }
    return false;
}

void UssdEngine::onSnapshotChanged(const std::string& sourceId) {
    if (!_hasSession) return;
    if (!isAllowedSource(sourceId)) return;
    if (!_tracker.acceptEvent(_hal.getMillis())) return;

    Snapshot snapshot;
    std::string text;
    if (readMessage(snapshot, text)) {
        handleMessage(text);
    }
    publishState();
}

bool UssdEngine::readMessage(Snapshot& snapshot, std::string& outText) {
    if (!_snapshots.currentSnapshot(snapshot)) {
        logKeyValue("Snapshot", "unavailable, event dropped");
        return false;
    }
    if (!SnapshotClassifier::extractMessage(snapshot.root, outText)) return false;

    // Some other screen flashed by. Not part of the conversation.
    return SnapshotClassifier::isProtocolContent(outText);
}

void UssdEngine::handleMessage(const std::string& text) {
    bool firstSighting = false;
    TurnClass turnClass = _tracker.observe(text, firstSighting);

    if (turnClass == TURN_IGNORED || turnClass == TURN_REPEAT_NON_TERMINAL) return;

    SessionHandle handle = _session.handle;

    if (firstSighting) {
        std::string preview = TextUtils::flatten(TextUtils::truncate(text, MAX_LOG_LENGTH - 16));
        logKeyValue("Turn", preview.c_str());
        logKeyValue("Class", turnClassToString(turnClass));

        _listener.onTurnText(handle, text);
        // The listener is allowed to cancel from inside the callback.
        if (!_hasSession || _session.handle != handle) return;
    }

    if (turnClass == TURN_NEW_ERROR_TERMINAL) {
        finishSession(false, text);
        return;
    }

    if (firstSighting) {
        // A deferred response belongs to the previous turn.
        _scheduler.cancel(TIMER_SEND_RETRY);
        armSessionTimeout();
    }

    Fingerprint fp = _state.currentFingerprint;
    _scheduler.schedule(TIMER_STABILIZE, _timings.stabilizeMs, [this, fp]() { onStabilized(fp); });
}

void UssdEngine::onStabilized(Fingerprint fp) {
    if (!_hasSession || !_tracker.isCurrent(fp)) return;

    Snapshot snapshot;
    std::string text;
    if (!readMessage(snapshot, text)) {
        // Stays unstabilized. The next event for this turn re-arms the timer.
        return;
    }

    if (TextUtils::fingerprint(text) != fp) {
        // Still painting
        handleMessage(text);
        return;
    }

    _tracker.markStabilized();

    if (OutcomeExtractor::isSuccessMessage(text)) {
        finishSession(true, text);
        return;
    }

    attemptResponse(snapshot);
}

void UssdEngine::attemptResponse(const Snapshot& snapshot) {
    Fingerprint fp = _state.currentFingerprint;

    if (!_tracker.canRespond()) {
        if (_state.isSubmitting && !_tracker.isAnswered()) {
            // Previous response still going out. Try again once it has cooled down.
            _scheduler.schedule(TIMER_SEND_RETRY, _timings.postSendCooldownMs, [this, fp]() { retryResponse(fp); });
        }
        return;
    }

    uint32_t delay = _tracker.sendDelay(_hal.getMillis());
    if (delay > 0) {
        _scheduler.schedule(TIMER_SEND_RETRY, delay, [this, fp]() { retryResponse(fp); });
        return;
    }

    std::string response;
    ProgressField field = FIELD_NONE;
    if (!ResponsePlanner::decideResponse(_session, _state.currentText, response, &field)) {
        logKeyValue("Plan", "no response for this turn");
        return;
    }

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "%s (step %u)", fieldToString(field), (unsigned)_session.progress.stepCounter);
    logKeyValue("Plan", logBuf);

    _injector.respond(snapshot, fp, response);
}

void UssdEngine::retryResponse(Fingerprint fp) {
    if (!_hasSession || !_tracker.isCurrent(fp)) return;

    Snapshot snapshot;
    std::string text;
    if (!readMessage(snapshot, text)) {
        // The turn is already stabilized, so no event will bring it back.
        _scheduler.schedule(TIMER_SEND_RETRY, _timings.focusRetryMs, [this, fp]() { retryResponse(fp); });
        return;
    }

    if (TextUtils::fingerprint(text) != fp) {
        handleMessage(text);
        return;
    }

    attemptResponse(snapshot);
}
