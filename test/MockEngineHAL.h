/*
 * File: test/MockEngineHAL.h
 * Description: A "Spy" implementation of every engine collaborator for Native Unit Tests.
 * One object plays the HAL, the phone screen, the actuator, the dialer and the listener.
 */
#pragma once
#include "EngineContext.h"
#include "SnapshotQuery.h"
#include <string>
#include <vector>
#include <stdio.h>
#include <cstring>

// Node ids used by showDialog()
#define MOCK_MESSAGE_ID 2
#define MOCK_INPUT_ID 3
#define MOCK_CANCEL_ID 4
#define MOCK_SEND_ID 5
#define MOCK_OK_ID 6

class MockEngineHAL : public IEngineHAL,
                      public ISnapshotSource,
                      public IInputActuator,
                      public IDialer,
                      public IEngineListener {
public:
    // Simulation Variables
    uint32_t currentMillis = 1000;
    std::vector<std::string> logs;

    // Screen State
    bool snapshotAvailable = false;
    Snapshot screen;

    // Actuator Spy
    std::vector<std::string> typedTexts;
    std::vector<std::string> activatedLabels;
    int focusRequests = 0;
    bool refuseSetText = false;
    bool refuseActivate = false;
    bool grantFocus = true;

    // Dialer Spy
    int dialCount = 0;
    std::string lastDialed;
    bool dialFails = false;

    // Listener Spy
    std::vector<Outcome> outcomes;
    std::vector<std::string> turnTexts;
    std::vector<SessionHandle> cancelled;

    // --- Helpers for Test Control ---

    void advanceTime(uint32_t ms) {
        currentMillis += ms;
    }

    // Puts a USSD dialog on screen: message, then either an input field with
    // Cancel/Send or a single OK button.
    void showDialog(const std::string& message, bool withInput = true, bool inputFocused = true,
                    const char* sourceId = "com.android.phone") {
        screen = Snapshot();
        screen.sourceId = sourceId;
        screen.root.id = 1;
        screen.root.className = "android.widget.FrameLayout";

        screen.root.children.push_back(makeNode(MOCK_MESSAGE_ID, "android.widget.TextView", message, false));

        if (withInput) {
            SnapshotNode input = makeNode(MOCK_INPUT_ID, "android.widget.EditText", "", true);
            input.editable = true;
            input.focused = inputFocused;
            screen.root.children.push_back(input);
            screen.root.children.push_back(makeNode(MOCK_CANCEL_ID, "android.widget.Button", "Cancel", true));
            screen.root.children.push_back(makeNode(MOCK_SEND_ID, "android.widget.Button", "Send", true));
        } else {
            screen.root.children.push_back(makeNode(MOCK_OK_ID, "android.widget.Button", "OK", true));
        }
        snapshotAvailable = true;
    }

    void closeDialog() {
        snapshotAvailable = false;
    }

    SnapshotNode* findNode(uint32_t id) {
        for (size_t i = 0; i < screen.root.children.size(); i++) {
            if (screen.root.children[i].id == id) return &screen.root.children[i];
        }
        return nullptr;
    }

    bool hasLog(const char* fragment) const {
        for (size_t i = 0; i < logs.size(); i++) {
            if (logs[i].find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    int countActivated(const char* label) const {
        int n = 0;
        for (size_t i = 0; i < activatedLabels.size(); i++) {
            if (activatedLabels[i] == label) n++;
        }
        return n;
    }

    // --- IEngineHAL Implementation ---

    void log(const char* message) override {
        logs.push_back(std::string(message));
    }

    unsigned long getMillis() override {
        return currentMillis;
    }

    // --- ISnapshotSource Implementation ---

    bool currentSnapshot(Snapshot& out) override {
        if (!snapshotAvailable) return false;
        out = screen;
        return true;
    }

    // --- IInputActuator Implementation ---

    const SnapshotNode* findInputField(const Snapshot& snapshot) override {
        return SnapshotQuery::findInputField(snapshot.root);
    }

    const SnapshotNode* findControlByLabel(const Snapshot& snapshot, const char* const* labels,
                                           size_t labelCount) override {
        return SnapshotQuery::findControlByLabel(snapshot.root, labels, labelCount);
    }

    bool setText(const SnapshotNode& control, const std::string& text) override {
        if (refuseSetText || !snapshotAvailable) return false;
        SnapshotNode* live = findNode(control.id);
        if (!live) return false;

        live->text = text;
        typedTexts.push_back(text);
        return true;
    }

    bool activate(const SnapshotNode& control) override {
        if (refuseActivate || !snapshotAvailable) return false;
        if (!findNode(control.id)) return false;

        activatedLabels.push_back(control.text);
        return true;
    }

    bool requestFocus(const SnapshotNode& control) override {
        focusRequests++;
        SnapshotNode* live = findNode(control.id);
        if (!live) return false;
        if (grantFocus) live->focused = true;
        return true;
    }

    // --- IDialer Implementation ---

    bool dial(const char* shortCode) override {
        dialCount++;
        lastDialed = shortCode;
        return !dialFails;
    }

    // --- IEngineListener Implementation ---

    void onTurnText(SessionHandle handle, const std::string& text) override {
        (void)handle;
        turnTexts.push_back(text);
    }

    void onOutcome(const Outcome& outcome) override {
        outcomes.push_back(outcome);
    }

    void onCancelled(SessionHandle handle) override {
        cancelled.push_back(handle);
    }

private:
    static SnapshotNode makeNode(uint32_t id, const char* className, const std::string& text, bool clickable) {
        SnapshotNode node;
        node.id = id;
        node.className = className;
        node.text = text;
        node.clickable = clickable;
        return node;
    }
};
