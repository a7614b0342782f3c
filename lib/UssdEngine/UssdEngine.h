/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/UssdEngine.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the UssdEngine class.
 *
 * NOTES:
 * 1. Decoupled from the platform via ISnapshotSource / IInputActuator / IDialer.
 * 2. Decision logic lives in ResponsePlanner's per-kind cascades.
 * 3. Single loop thread: onSnapshotChanged() and tick() must be called from it.
 * 4. Session, handle and last answered fingerprint are mirrored into atomics
 *    for readers on other threads.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <string>
#include <vector>

#include "Types.h"
#include "EngineContext.h"
#include "TaskScheduler.h"
#include "TurnTracker.h"
#include "ResponseInjector.h"

class UssdEngine {
public:
    UssdEngine(IEngineHAL& hal,
               ISnapshotSource& snapshots,
               IInputActuator& actuator,
               IDialer& dialer,
               IEngineListener& listener,
               const EngineTimings& timings,
               const char* shortCode,
               const char* const* allowedSources);

    // --- Main Loop Tick ---
    void tick();

    // --- OS Event Feed ---
    void onSnapshotChanged(const std::string& sourceId);

    // --- API Commands ---
    // All return STATUS_* codes. outHandle is set whenever a session was created,
    // including the STATUS_DIAL_FAILED case (its failure Outcome is already out).
    int startBalanceCheck(const BankSecrets& secrets, SessionHandle& outHandle);
    int startSendMoney(const BankSecrets& secrets,
                       const std::string& recipient,
                       double amount,
                       const std::string& remarks,
                       SessionHandle& outHandle);
    int startLinkBank(const BankSecrets& secrets, SessionHandle& outHandle);
    bool cancel(SessionHandle handle);

    // --- State Accessors (loop thread) ---
    const EngineState& getState() const { return _state; }
    const Session* getSession() const { return _hasSession ? &_session : nullptr; }
    const EngineTimings& getTimings() const { return _timings; }
    int pendingTimers() const { return _scheduler.pendingCount(); }

    // --- State Accessors (any thread) ---
    bool isSessionActive() const { return _activeFlag.load(); }
    SessionHandle activeHandle() const { return _activeHandle.load(); }
    Fingerprint lastRespondedFingerprint() const { return _lastResponded.load(); }

    void printStartupDiagnostics();
    bool validateTimings(const EngineTimings& timings) const;
    bool validateRequest(OperationKind kind, const BankSecrets& secrets,
                         const TransferParams& transfer, std::string& errorMsg) const;

private:
    // --- Dependencies ---
    IEngineHAL& _hal;
    ISnapshotSource& _snapshots;
    IInputActuator& _actuator;
    IDialer& _dialer;
    IEngineListener& _listener;

    // --- Configuration ---
    EngineTimings _timings;
    std::string _shortCode;
    std::vector<std::string> _allowedSources;

    // --- Dynamic State ---
    EngineState _state;
    Session _session;
    bool _hasSession;
    SessionHandle _nextHandle;

    TaskScheduler _scheduler;
    TurnTracker _tracker;
    ResponseInjector _injector;

    std::atomic<bool> _activeFlag;
    std::atomic<uint32_t> _activeHandle;
    std::atomic<uint32_t> _lastResponded;

    // =========================================================================
    // SECTION: SESSION LIFECYCLE
    // =========================================================================

    int beginSession(OperationKind kind, const BankSecrets& secrets,
                     const TransferParams& transfer, SessionHandle& outHandle);
    void finishSession(bool success, const std::string& message);
    void clearSession();
    void armSessionTimeout();
    void onSessionTimeout(SessionHandle handle);

    // =========================================================================
    // SECTION: TURN PROCESSING
    // =========================================================================

    bool isAllowedSource(const std::string& sourceId) const;
    bool readMessage(Snapshot& snapshot, std::string& outText);
    void handleMessage(const std::string& text);
    void onStabilized(Fingerprint fp);
    void attemptResponse(const Snapshot& snapshot);
    void retryResponse(Fingerprint fp);

    void publishState();
    void logKeyValue(const char* key, const char* value);
};
