/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/TurnTracker.h
 *
 * Description:
 * Stabilization and deduplication over the engine's EngineState.
 * Decides whether an observed message is noise, a repeat, or a new turn, and
 * guards the "at most one response per fingerprint" rule.
 * Holds no timers itself; the engine schedules stabilization and retries.
 * =================================================================================
 */
#pragma once
#include <string>

#include "Types.h"

class TurnTracker {
public:
    TurnTracker(EngineState& state, const EngineTimings& timings);

    // Debounce. Returns false for events inside the window after the last
    // accepted one. Accepted events move the window.
    bool acceptEvent(unsigned long now);

    /**
     * Classifies an extracted message against the tracked turn.
     * A new fingerprint becomes the current turn (unstabilized).
     * @param outFirstSighting true when this call switched to a new turn.
     * @return IGNORED for empty text, REPEAT for the stabilized current turn,
     *         NEW_ERROR_TERMINAL for a new turn carrying an error keyword,
     *         NEW_NON_TERMINAL otherwise (including an unstabilized repeat).
     */
    TurnClass observe(const std::string& text, bool& outFirstSighting);

    void markStabilized() { _state.isStabilized = true; }

    bool isCurrent(Fingerprint fp) const { return _state.currentFingerprint == fp; }

    // Stabilized, not answered yet, no submission in flight.
    bool canRespond() const;

    bool isAnswered() const;

    // 0 if a response may go out now, otherwise how long to defer it.
    uint32_t sendDelay(unsigned long now) const;

    // --- Submission lock ---
    void beginSubmit() { _state.isSubmitting = true; }
    void markResponded(Fingerprint fp) { _state.lastRespondedFingerprint = fp; }
    void markSubmitted(unsigned long now) { _state.lastSubmitTimestamp = now; }
    void endSubmit() { _state.isSubmitting = false; }

    void reset() { resetState(_state); }

    static void resetState(EngineState& state);

private:
    EngineState& _state;
    const EngineTimings& _timings;
};
