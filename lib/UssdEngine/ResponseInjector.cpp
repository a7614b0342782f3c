/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/ResponseInjector.cpp
 * =================================================================================
 */
#include <stdio.h>

#include "ResponseInjector.h"

const char* const ResponseInjector::SUBMIT_LABELS[] = { "Send", "Reply", "OK", "Submit", "Confirm" };
const size_t ResponseInjector::SUBMIT_LABEL_COUNT = sizeof(SUBMIT_LABELS) / sizeof(SUBMIT_LABELS[0]);

const char* const ResponseInjector::ACK_LABELS[] = { "OK", "Dismiss", "Close" };
const size_t ResponseInjector::ACK_LABEL_COUNT = sizeof(ACK_LABELS) / sizeof(ACK_LABELS[0]);

const char* const ResponseInjector::DISMISS_LABELS[] = { "Cancel", "OK", "Close", "Dismiss", "Done" };
const size_t ResponseInjector::DISMISS_LABEL_COUNT = sizeof(DISMISS_LABELS) / sizeof(DISMISS_LABELS[0]);

ResponseInjector::ResponseInjector(IEngineHAL& hal,
                                   ISnapshotSource& snapshots,
                                   IInputActuator& actuator,
                                   TaskScheduler& scheduler,
                                   TurnTracker& tracker,
                                   const EngineTimings& timings)
    : _hal(hal),
      _snapshots(snapshots),
      _actuator(actuator),
      _scheduler(scheduler),
      _tracker(tracker),
      _timings(timings),
      _inFlight(false),
      _pendingFingerprint(0)
{
}

void ResponseInjector::reset() {
    _inFlight = false;
    _pendingFingerprint = 0;
    _pendingText.clear();
}

// =================================================================================
// SECTION: DELIVERY PIPELINE
// =================================================================================

bool ResponseInjector::respond(const Snapshot& snapshot, Fingerprint fp, const std::string& response) {
    const SnapshotNode* input = _actuator.findInputField(snapshot);

    if (input) {
        _inFlight = true;
        _pendingFingerprint = fp;
        _pendingText = response;
        _tracker.beginSubmit();

        if (!input->focused) {
            if (!_actuator.requestFocus(*input)) {
                abort("focus refused");
                return false;
            }
            // Give the dialog time to grant focus before typing.
            _scheduler.schedule(TIMER_FOCUS, _timings.focusRetryMs, [this]() { injectPending(); });
            return true;
        }
        return injectInto(snapshot);
    }

    // No free field: an informational turn that only wants acknowledging.
    const SnapshotNode* ack = _actuator.findControlByLabel(snapshot, ACK_LABELS, ACK_LABEL_COUNT);
    if (ack) {
        if (_actuator.activate(*ack)) {
            // Counts as a submission for pacing. The turn stays unanswered.
            _tracker.beginSubmit();
            _tracker.markSubmitted(_hal.getMillis());
            _hal.log(" Inject   : acknowledged dialog");

            _scheduler.schedule(TIMER_COOLDOWN, _timings.postSendCooldownMs, [this]() { finishCooldown(); });
            return true;
        }
        _hal.log(" Inject   : acknowledge refused");
        return false;
    }

    _hal.log(" Inject   : no input field or acknowledge control");
    return false;
}

void ResponseInjector::injectPending() {
    if (!_inFlight) return;

    Snapshot snapshot;
    if (!_snapshots.currentSnapshot(snapshot)) {
        abort("snapshot unavailable");
        return;
    }
    injectInto(snapshot);
}

bool ResponseInjector::injectInto(const Snapshot& snapshot) {
    const SnapshotNode* input = _actuator.findInputField(snapshot);
    if (!input) {
        abort("input field gone");
        return false;
    }
    if (!_actuator.setText(*input, _pendingText)) {
        abort("text rejected");
        return false;
    }

    // Answered from this moment on, even if the submit is slow.
    _tracker.markResponded(_pendingFingerprint);

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), " Inject   : %u chars typed", (unsigned)_pendingText.size());
    _hal.log(logBuf);

    _scheduler.schedule(TIMER_SUBMIT, _timings.textInjectionDelayMs, [this]() { submitPending(); });
    return true;
}

void ResponseInjector::submitPending() {
    if (!_inFlight) return;

    Snapshot snapshot;
    if (!_snapshots.currentSnapshot(snapshot)) {
        abort("snapshot unavailable");
        return;
    }

    const SnapshotNode* control = _actuator.findControlByLabel(snapshot, SUBMIT_LABELS, SUBMIT_LABEL_COUNT);
    if (!control) {
        abort("submit control not found");
        return;
    }
    if (!_actuator.activate(*control)) {
        abort("submit refused");
        return;
    }

    _tracker.markSubmitted(_hal.getMillis());
    _hal.log(" Inject   : submitted");

    _scheduler.schedule(TIMER_COOLDOWN, _timings.postSendCooldownMs, [this]() { finishCooldown(); });
}

void ResponseInjector::finishCooldown() {
    reset();
    _tracker.endSubmit();
}

void ResponseInjector::abort(const char* reason) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), " Inject   : aborted (%s)", reason);
    _hal.log(logBuf);

    _scheduler.cancel(TIMER_FOCUS);
    _scheduler.cancel(TIMER_SUBMIT);
    _scheduler.cancel(TIMER_COOLDOWN);

    reset();
    _tracker.endSubmit();
}

// =================================================================================
// SECTION: DISMISSAL
// =================================================================================

bool ResponseInjector::dismissDialog() {
    Snapshot snapshot;
    if (!_snapshots.currentSnapshot(snapshot)) return false;

    const SnapshotNode* control = _actuator.findControlByLabel(snapshot, DISMISS_LABELS, DISMISS_LABEL_COUNT);
    if (!control) return false;

    bool ok = _actuator.activate(*control);
    _hal.log(ok ? " Inject   : dialog dismissed" : " Inject   : dismiss refused");
    return ok;
}
