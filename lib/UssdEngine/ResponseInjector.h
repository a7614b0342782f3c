/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/ResponseInjector.h
 *
 * Description:
 * Delivers a decided response into the USSD dialog:
 * focus -> inject text -> (delay) -> activate submit -> (cooldown) -> unlock.
 * Every stage after the first runs from a scheduled callback and re-reads the
 * snapshot, since element trees go stale between events.
 * Any failure aborts the in-flight response and releases the submission lock.
 * =================================================================================
 */
#pragma once
#include <string>

#include "EngineContext.h"
#include "TaskScheduler.h"
#include "TurnTracker.h"

class ResponseInjector {
public:
    ResponseInjector(IEngineHAL& hal,
                     ISnapshotSource& snapshots,
                     IInputActuator& actuator,
                     TaskScheduler& scheduler,
                     TurnTracker& tracker,
                     const EngineTimings& timings);

    /**
     * Starts delivering 'response' for the turn 'fp'.
     * @return false if nothing could be actuated (lock already released).
     */
    bool respond(const Snapshot& snapshot, Fingerprint fp, const std::string& response);

    // Activates a dismiss control if one is showing. Used after a success outcome.
    bool dismissDialog();

    bool isBusy() const { return _inFlight; }

    // Forgets the in-flight response. Timers are cancelled by the owner.
    void reset();

    static const char* const SUBMIT_LABELS[];
    static const size_t SUBMIT_LABEL_COUNT;
    static const char* const ACK_LABELS[];
    static const size_t ACK_LABEL_COUNT;
    static const char* const DISMISS_LABELS[];
    static const size_t DISMISS_LABEL_COUNT;

private:
    IEngineHAL& _hal;
    ISnapshotSource& _snapshots;
    IInputActuator& _actuator;
    TaskScheduler& _scheduler;
    TurnTracker& _tracker;
    const EngineTimings& _timings;

    // --- In-flight response ---
    bool _inFlight;
    Fingerprint _pendingFingerprint;
    std::string _pendingText;

    void injectPending();
    bool injectInto(const Snapshot& snapshot);
    void submitPending();
    void finishCooldown();
    void abort(const char* reason);
};
