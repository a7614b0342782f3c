/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/TaskScheduler.h
 *
 * Description:
 * Delayed-callback wheel for the engine's single loop thread. One slot per
 * TimerCategory: scheduling into an armed slot replaces the pending callback,
 * so a superseded timer can never fire on stale state.
 * Callbacks run from runDue(), which the owner calls from its tick().
 * =================================================================================
 */
#pragma once
#include <functional>

#include "EngineContext.h"
#include "Types.h"

typedef uint32_t TimerHandle;

class TaskScheduler {
public:
    typedef std::function<void()> Callback;

    explicit TaskScheduler(IEngineHAL& hal);

    // Arms 'category' to fire after delayMs, replacing any pending callback.
    TimerHandle schedule(TimerCategory category, uint32_t delayMs, Callback callback);

    // Returns true if something was pending.
    bool cancel(TimerCategory category);

    // Cancels only if 'handle' is still the pending timer of its category.
    bool cancel(TimerHandle handle);

    void cancelAll();

    bool isPending(TimerCategory category) const;
    int pendingCount() const;

    // Runs every callback whose delay has elapsed, earliest first.
    // Returns the number of callbacks executed.
    int runDue();

private:
    struct Slot {
        bool armed;
        TimerHandle handle;
        unsigned long armedAt;
        uint32_t delayMs;
        Callback callback;
    };

    IEngineHAL& _hal;
    Slot _slots[TIMER_CATEGORY_COUNT];
    TimerHandle _nextHandle;

    int findNextDue(unsigned long now) const;
};
