/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      src/ScriptedTerminal.cpp
 * =================================================================================
 */
#include "ScriptedTerminal.h"

#include <stdio.h>

#include "SnapshotQuery.h"

// Node ids of the simulated dialog
static const uint32_t ROOT_ID = 1;
static const uint32_t MESSAGE_ID = 2;
static const uint32_t INPUT_ID = 3;
static const uint32_t CANCEL_ID = 4;
static const uint32_t SEND_ID = 5;
static const uint32_t OK_ID = 6;

static const char *const WILDCARD_REPLY = "*";

ScriptedTerminal::ScriptedTerminal(IEngineHAL &hal)
    : _hal(hal), _sourceId("com.android.phone"), _networkDelayMs(400), _paintSteps(1), _paintIntervalMs(50),
      _inputFocusedByDefault(false), _dialFails(false), _current(-1), _paintedStep(0), _inputFocused(false),
      _finished(false), _pendingScreen(-1), _pendingArmedAt(0), _pendingDelayMs(0), _paintArmedAt(0) {}

void ScriptedTerminal::log(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

// =================================================================================
// SECTION: SCRIPT LOADING
// =================================================================================

bool ScriptedTerminal::load(const JsonVariant &script, std::string &errorMsg) {
  if (!script.is<JsonObject>()) {
    errorMsg = "Script must be a JSON object.";
    return false;
  }

  // 1. Terminal behaviour
  _sourceId = script["source"] | "com.android.phone";
  _startId = script["start"] | "";
  _networkDelayMs = script["networkDelayMs"] | 400;
  _paintSteps = script["paintSteps"] | 1;
  _paintIntervalMs = script["paintIntervalMs"] | 50;
  _inputFocusedByDefault = script["inputFocused"] | false;
  _dialFails = script["dialFails"] | false;

  if (_paintSteps == 0) _paintSteps = 1;

  // 2. Screens
  if (!script["screens"].is<JsonArray>()) {
    errorMsg = "Script needs a 'screens' array.";
    return false;
  }

  std::vector<Screen> screens;
  for (JsonVariant v : script["screens"].as<JsonArray>()) {
    Screen screen;
    screen.id = v["id"] | "";
    screen.text = v["text"] | "";
    screen.hasInput = v["input"] | false;
    screen.fallback = v["fallback"] | "";

    if (screen.id.empty() || screen.text.empty()) {
      errorMsg = "Every screen needs an 'id' and a 'text'.";
      return false;
    }

    if (v["replies"].is<JsonObject>()) {
      for (JsonPair kv : v["replies"].as<JsonObject>()) {
        std::string target = kv.value() | "";
        screen.replies.push_back(std::make_pair(std::string(kv.key().c_str()), target));
      }
    }
    screens.push_back(screen);
  }

  // 3. Cross references
  _screens = screens;
  for (size_t i = 0; i < _screens.size(); i++) {
    for (size_t j = i + 1; j < _screens.size(); j++) {
      if (_screens[i].id == _screens[j].id) {
        errorMsg = "Duplicate screen id: " + _screens[i].id;
        return false;
      }
    }
    for (size_t r = 0; r < _screens[i].replies.size(); r++) {
      if (findScreen(_screens[i].replies[r].second) < 0) {
        errorMsg = "Unknown reply target: " + _screens[i].replies[r].second;
        return false;
      }
    }
    if (!_screens[i].fallback.empty() && findScreen(_screens[i].fallback) < 0) {
      errorMsg = "Unknown fallback target: " + _screens[i].fallback;
      return false;
    }
  }

  if (findScreen(_startId) < 0) {
    errorMsg = "Unknown start screen: " + _startId;
    return false;
  }

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "%u screens loaded", (unsigned)_screens.size());
  log("Script", logBuf);
  return true;
}

int ScriptedTerminal::findScreen(const std::string &id) const {
  for (size_t i = 0; i < _screens.size(); i++) {
    if (_screens[i].id == id) return (int)i;
  }
  return -1;
}

const std::string &ScriptedTerminal::currentScreenId() const {
  static const std::string NONE;
  return _current >= 0 ? _screens[_current].id : NONE;
}

// =================================================================================
// SECTION: SIMULATION LOOP
// =================================================================================

void ScriptedTerminal::tick() {
  unsigned long now = _hal.getMillis();

  if (_pendingScreen >= 0 && (now - _pendingArmedAt) >= _pendingDelayMs) {
    int index = _pendingScreen;
    _pendingScreen = -1;
    showScreen(index);
    return;
  }

  if (_current >= 0 && _paintedStep < _paintSteps && (now - _paintArmedAt) >= _paintIntervalMs) {
    _paintedStep++;
    _paintArmedAt = now;
    notifyChanged();
  }
}

void ScriptedTerminal::scheduleScreen(const std::string &id, uint32_t delayMs) {
  _pendingScreen = findScreen(id);
  _pendingArmedAt = _hal.getMillis();
  _pendingDelayMs = delayMs;
}

void ScriptedTerminal::showScreen(int index) {
  _current = index;
  _paintedStep = 1;
  _paintArmedAt = _hal.getMillis();
  _typed.clear();
  _inputFocused = _inputFocusedByDefault;

  log("Network", _screens[index].id.c_str());
  notifyChanged();
}

void ScriptedTerminal::closeDialog() {
  _current = -1;
  _typed.clear();
  _inputFocused = false;
}

void ScriptedTerminal::notifyChanged() {
  if (_onChanged) _onChanged(_sourceId);
}

std::string ScriptedTerminal::visibleText() const {
  const std::string &full = _screens[_current].text;
  if (_paintedStep >= _paintSteps) return full;

  size_t cut = full.size() * _paintedStep / _paintSteps;
  return full.substr(0, cut);
}

void ScriptedTerminal::submit() {
  const Screen &screen = _screens[_current];
  std::string response = _typed;
  _sent.push_back(response);

  std::string target;
  for (size_t i = 0; i < screen.replies.size(); i++) {
    if (screen.replies[i].first == response) {
      target = screen.replies[i].second;
      break;
    }
  }
  if (target.empty()) {
    for (size_t i = 0; i < screen.replies.size(); i++) {
      if (screen.replies[i].first == WILDCARD_REPLY) {
        target = screen.replies[i].second;
        break;
      }
    }
  }
  if (target.empty()) target = screen.fallback;

  closeDialog();

  if (target.empty()) {
    log("Network", "session released");
    _finished = true;
    return;
  }
  scheduleScreen(target, _networkDelayMs);
}

// =================================================================================
// SECTION: ISnapshotSource
// =================================================================================

bool ScriptedTerminal::currentSnapshot(Snapshot &out) {
  if (_current < 0) return false;

  const Screen &screen = _screens[_current];

  out.sourceId = _sourceId;
  out.root = SnapshotNode();
  out.root.id = ROOT_ID;
  out.root.className = "android.widget.FrameLayout";

  SnapshotNode message;
  message.id = MESSAGE_ID;
  message.className = "android.widget.TextView";
  message.text = visibleText();
  out.root.children.push_back(message);

  if (screen.hasInput) {
    SnapshotNode input;
    input.id = INPUT_ID;
    input.className = "android.widget.EditText";
    input.editable = true;
    input.clickable = true;
    input.focused = _inputFocused;
    input.text = _typed;
    out.root.children.push_back(input);

    SnapshotNode cancel;
    cancel.id = CANCEL_ID;
    cancel.className = "android.widget.Button";
    cancel.text = "Cancel";
    cancel.clickable = true;
    out.root.children.push_back(cancel);

    SnapshotNode send;
    send.id = SEND_ID;
    send.className = "android.widget.Button";
    send.text = "Send";
    send.clickable = true;
    out.root.children.push_back(send);
  } else {
    SnapshotNode ok;
    ok.id = OK_ID;
    ok.className = "android.widget.Button";
    ok.text = "OK";
    ok.clickable = true;
    out.root.children.push_back(ok);
  }
  return true;
}

// =================================================================================
// SECTION: IInputActuator
// =================================================================================

const SnapshotNode *ScriptedTerminal::findInputField(const Snapshot &snapshot) {
  return SnapshotQuery::findInputField(snapshot.root);
}

const SnapshotNode *ScriptedTerminal::findControlByLabel(const Snapshot &snapshot, const char *const *labels,
                                                         size_t labelCount) {
  return SnapshotQuery::findControlByLabel(snapshot.root, labels, labelCount);
}

bool ScriptedTerminal::setText(const SnapshotNode &control, const std::string &text) {
  if (_current < 0 || !_screens[_current].hasInput || control.id != INPUT_ID) return false;
  if (!_inputFocused) return false;

  _typed = text;
  return true;
}

bool ScriptedTerminal::requestFocus(const SnapshotNode &control) {
  if (_current < 0 || !_screens[_current].hasInput || control.id != INPUT_ID) return false;

  _inputFocused = true;
  return true;
}

bool ScriptedTerminal::activate(const SnapshotNode &control) {
  if (_current < 0) return false;
  const Screen &screen = _screens[_current];

  if (screen.hasInput && control.id == SEND_ID) {
    submit();
    return true;
  }

  if (screen.hasInput && control.id == CANCEL_ID) {
    log("Network", "dialog cancelled");
    closeDialog();
    _finished = true;
    return true;
  }

  if (!screen.hasInput && control.id == OK_ID) {
    std::string next = screen.fallback;
    closeDialog();
    if (next.empty()) {
      log("Network", "dialog closed");
      _finished = true;
    } else {
      scheduleScreen(next, _networkDelayMs);
    }
    return true;
  }

  return false;
}

// =================================================================================
// SECTION: IDialer
// =================================================================================

bool ScriptedTerminal::dial(const char *shortCode) {
  if (_dialFails || _screens.empty()) {
    log("Dial", "refused by terminal");
    return false;
  }

  _finished = false;
  _sent.clear();
  closeDialog();
  scheduleScreen(_startId, _networkDelayMs);

  log("Dial", shortCode);
  return true;
}
