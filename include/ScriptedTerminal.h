/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      include/ScriptedTerminal.h
 *
 * Description:
 * A USSD network and dialog simulator driven by a JSON script. Plays the part
 * of the phone: it is the snapshot source, the input actuator and the dialer.
 *
 * Script layout:
 *   {
 *     "source": "com.android.phone",
 *     "start": "main",
 *     "networkDelayMs": 400,      // dial/submit -> next screen
 *     "paintSteps": 2,            // partial paints before the full text
 *     "paintIntervalMs": 50,
 *     "inputFocused": false,      // input needs requestFocus() first
 *     "dialFails": false,
 *     "screens": [
 *       { "id": "main", "text": "1. Send Money\n2. Check Balance", "input": true,
 *         "replies": { "2": "pin" }, "fallback": "invalid" },
 *       ...
 *     ]
 *   }
 * A screen without "input" is final and shows an OK button.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "EngineContext.h"
#include "Types.h"

class ScriptedTerminal : public ISnapshotSource, public IInputActuator, public IDialer {
public:
  typedef std::function<void(const std::string &sourceId)> ChangeCallback;

  explicit ScriptedTerminal(IEngineHAL &hal);

  bool load(const JsonVariant &script, std::string &errorMsg);

  // Called by the main loop. Delivers due screens and paint steps.
  void tick();

  void setChangeCallback(ChangeCallback callback) { _onChanged = callback; }

  // --- Inspection ---
  bool isDialogShowing() const { return _current >= 0; }
  bool isFinished() const { return _finished; }
  const std::string &currentScreenId() const;
  const std::vector<std::string> &sentResponses() const { return _sent; }
  const std::string &sourceId() const { return _sourceId; }

  // --- ISnapshotSource ---
  bool currentSnapshot(Snapshot &out) override;

  // --- IInputActuator ---
  const SnapshotNode *findInputField(const Snapshot &snapshot) override;
  const SnapshotNode *findControlByLabel(const Snapshot &snapshot, const char *const *labels,
                                         size_t labelCount) override;
  bool setText(const SnapshotNode &control, const std::string &text) override;
  bool activate(const SnapshotNode &control) override;
  bool requestFocus(const SnapshotNode &control) override;

  // --- IDialer ---
  bool dial(const char *shortCode) override;

private:
  struct Screen {
    std::string id;
    std::string text;
    bool hasInput;
    std::vector<std::pair<std::string, std::string> > replies;
    std::string fallback;
  };

  IEngineHAL &_hal;

  // --- Script ---
  std::vector<Screen> _screens;
  std::string _sourceId;
  std::string _startId;
  uint32_t _networkDelayMs;
  uint32_t _paintSteps;
  uint32_t _paintIntervalMs;
  bool _inputFocusedByDefault;
  bool _dialFails;

  // --- Dialog State ---
  int _current;          // index into _screens, -1 when no dialog
  uint32_t _paintedStep; // 1.._paintSteps, full text at _paintSteps
  bool _inputFocused;
  std::string _typed;
  bool _finished;
  std::vector<std::string> _sent;

  // --- Pending Network Reply ---
  int _pendingScreen;
  unsigned long _pendingArmedAt;
  uint32_t _pendingDelayMs;
  unsigned long _paintArmedAt;

  ChangeCallback _onChanged;

  int findScreen(const std::string &id) const;
  void scheduleScreen(const std::string &id, uint32_t delayMs);
  void showScreen(int index);
  void closeDialog();
  void submit();
  std::string visibleText() const;
  void notifyChanged();
  void log(const char *key, const char *value);
};
