/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/TaskScheduler.cpp
 * =================================================================================
 */
#include "TaskScheduler.h"

// Upper bound per runDue() so a callback that keeps re-arming itself with a
// zero delay cannot starve the loop.
static const int MAX_CALLBACKS_PER_RUN = 64;

TaskScheduler::TaskScheduler(IEngineHAL& hal)
    : _hal(hal),
      _nextHandle(1)
{
    for (int i = 0; i < TIMER_CATEGORY_COUNT; i++) {
        _slots[i].armed = false;
        _slots[i].handle = 0;
        _slots[i].armedAt = 0;
        _slots[i].delayMs = 0;
    }
}

TimerHandle TaskScheduler::schedule(TimerCategory category, uint32_t delayMs, Callback callback) {
    Slot& slot = _slots[category];

    slot.armed = true;
    slot.handle = _nextHandle++;
    if (_nextHandle == 0) _nextHandle = 1;
    slot.armedAt = _hal.getMillis();
    slot.delayMs = delayMs;
    slot.callback = callback;

    return slot.handle;
}

bool TaskScheduler::cancel(TimerCategory category) {
    Slot& slot = _slots[category];
    bool wasArmed = slot.armed;
    slot.armed = false;
    slot.callback = nullptr;
    return wasArmed;
}

bool TaskScheduler::cancel(TimerHandle handle) {
    for (int i = 0; i < TIMER_CATEGORY_COUNT; i++) {
        if (_slots[i].armed && _slots[i].handle == handle) {
            return cancel((TimerCategory)i);
        }
    }
    return false;
}

void TaskScheduler::cancelAll() {
    for (int i = 0; i < TIMER_CATEGORY_COUNT; i++) {
        cancel((TimerCategory)i);
    }
}

bool TaskScheduler::isPending(TimerCategory category) const {
    return _slots[category].armed;
}

int TaskScheduler::pendingCount() const {
    int count = 0;
    for (int i = 0; i < TIMER_CATEGORY_COUNT; i++) {
        if (_slots[i].armed) count++;
    }
    return count;
}

int TaskScheduler::findNextDue(unsigned long now) const {
    int best = -1;
    unsigned long bestOverdue = 0;

    for (int i = 0; i < TIMER_CATEGORY_COUNT; i++) {
        const Slot& slot = _slots[i];
        if (!slot.armed) continue;

        unsigned long elapsed = now - slot.armedAt;
        if (elapsed < slot.delayMs) continue;

        // The most overdue callback was due first. Ties go to the older handle.
        unsigned long overdue = elapsed - slot.delayMs;
        if (best < 0 || overdue > bestOverdue ||
            (overdue == bestOverdue && slot.handle < _slots[best].handle)) {
            best = i;
            bestOverdue = overdue;
        }
    }
    return best;
}

int TaskScheduler::runDue() {
    int executed = 0;

    while (executed < MAX_CALLBACKS_PER_RUN) {
        int index = findNextDue(_hal.getMillis());
        if (index < 0) break;

        // Disarm before running: the callback may re-arm its own category.
        Callback callback = _slots[index].callback;
        _slots[index].armed = false;
        _slots[index].callback = nullptr;

        if (callback) callback();
        executed++;
    }

    return executed;
}
