/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/TurnTracker.cpp
 * =================================================================================
 */
#include "TurnTracker.h"
#include "OutcomeExtractor.h"
#include "TextUtils.h"

TurnTracker::TurnTracker(EngineState& state, const EngineTimings& timings)
    : _state(state),
      _timings(timings)
{
    resetState(_state);
}

void TurnTracker::resetState(EngineState& state) {
    state.lastRespondedFingerprint = 0;
    state.currentFingerprint = 0;
    state.lastEventTimestamp = 0;
    state.lastSubmitTimestamp = 0;
    state.isSubmitting = false;
    state.isStabilized = false;
    state.currentText.clear();
}

bool TurnTracker::acceptEvent(unsigned long now) {
    if (_state.lastEventTimestamp != 0 &&
        (now - _state.lastEventTimestamp) < _timings.eventDebounceMs) {
        return false;
    }
    _state.lastEventTimestamp = now;
    return true;
}

TurnClass TurnTracker::observe(const std::string& text, bool& outFirstSighting) {
    outFirstSighting = false;
    if (TextUtils::isBlank(text)) return TURN_IGNORED;

    Fingerprint fp = TextUtils::fingerprint(text);

    if (fp == _state.currentFingerprint) {
        return _state.isStabilized ? TURN_REPEAT_NON_TERMINAL : TURN_NEW_NON_TERMINAL;
    }

    // New turn
    outFirstSighting = true;
    _state.currentFingerprint = fp;
    _state.currentText = text;
    _state.isStabilized = false;

    // Error turns are final. No settle time needed.
    if (OutcomeExtractor::isErrorMessage(text)) {
        return TURN_NEW_ERROR_TERMINAL;
    }
    return TURN_NEW_NON_TERMINAL;
}

bool TurnTracker::isAnswered() const {
    return _state.currentFingerprint != 0 &&
           _state.currentFingerprint == _state.lastRespondedFingerprint;
}

bool TurnTracker::canRespond() const {
    return _state.isStabilized && !_state.isSubmitting && !isAnswered();
}

uint32_t TurnTracker::sendDelay(unsigned long now) const {
    if (_state.lastSubmitTimestamp == 0) return 0;

    unsigned long elapsed = now - _state.lastSubmitTimestamp;
    if (elapsed >= _timings.minSendIntervalMs) return 0;

    return (uint32_t)(_timings.minSendIntervalMs - elapsed) + _timings.sendRetrySlackMs;
}
