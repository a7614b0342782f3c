/*
 * =================================================================================
 * File:      lib/UssdEngine/EngineContext.h
 * Description: Abstraction layer for the OS UI-introspection layer, input
 * injection, telephony, logging and result delivery.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "Snapshot.h"

class ISnapshotSource {
public:
    virtual ~ISnapshotSource() {}

    // Copies the current foreground element tree into 'out'.
    // Returns false if no window is available (stale or torn down).
    virtual bool currentSnapshot(Snapshot& out) = 0;
};

class IInputActuator {
public:
    virtual ~IInputActuator() {}

    // --- Lookup (depth-first over the given snapshot) ---
    // Returned pointers point into 'snapshot' and are only valid while it lives.
    virtual const SnapshotNode* findInputField(const Snapshot& snapshot) = 0;
    virtual const SnapshotNode* findControlByLabel(const Snapshot& snapshot,
                                                   const char* const* labels,
                                                   size_t labelCount) = 0;

    // --- Actions ---
    // All return false if the element is gone or the OS refused the action.
    virtual bool setText(const SnapshotNode& control, const std::string& text) = 0;
    virtual bool activate(const SnapshotNode& control) = 0;
    virtual bool requestFocus(const SnapshotNode& control) = 0;
};

class IDialer {
public:
    virtual ~IDialer() {}

    // Starts the USSD session with the network. Returns false if the request
    // could not be issued (permission, no service).
    virtual bool dial(const char* shortCode) = 0;
};

class IEngineListener {
public:
    virtual ~IEngineListener() {}

    // Raw text of every new turn, for progress display.
    virtual void onTurnText(SessionHandle handle, const std::string& text) = 0;

    // Exactly once per session that reaches a terminal turn or times out.
    virtual void onOutcome(const Outcome& outcome) = 0;

    // Acknowledges cancel().
    virtual void onCancelled(SessionHandle handle) = 0;
};

class IEngineHAL {
public:
    virtual ~IEngineHAL() {}

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Utils ---
    virtual unsigned long getMillis() = 0;
};
