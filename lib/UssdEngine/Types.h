/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/Types.h
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

// --- Enums ---
enum OperationKind : uint8_t { OP_BALANCE_CHECK, OP_SEND_MONEY, OP_LINK_BANK };
enum TurnClass : uint8_t { TURN_IGNORED, TURN_NEW_ERROR_TERMINAL, TURN_NEW_NON_TERMINAL, TURN_REPEAT_NON_TERMINAL };

// Timer categories. At most one pending timer per category.
enum TimerCategory : uint8_t {
  TIMER_STABILIZE,
  TIMER_SEND_RETRY,
  TIMER_FOCUS,
  TIMER_SUBMIT,
  TIMER_COOLDOWN,
  TIMER_DISMISS,
  TIMER_SESSION_TIMEOUT,
  TIMER_CATEGORY_COUNT
};

// Progress flags. Each bit goes 0 -> 1 exactly once per session.
enum ProgressField : uint8_t {
  FIELD_NONE = 0,
  FIELD_MENU_SELECTED,
  FIELD_PAYMENT_METHOD_SELECTED,
  FIELD_PIN_SENT,
  FIELD_BANK_SENT,
  FIELD_CARD_SENT,
  FIELD_RECIPIENT_SENT,
  FIELD_AMOUNT_SENT,
  FIELD_REMARKS_SENT
};

typedef uint32_t SessionHandle;
typedef uint32_t Fingerprint;

// --- Constants ---
#define INVALID_SESSION_HANDLE 0
#define MAX_LOG_LENGTH 150
#define DEFAULT_REMARKS "payment"

// --- Status Codes (returned by start operations) ---
#define STATUS_STARTED 200
#define STATUS_BAD_REQUEST 400
#define STATUS_BUSY 409
#define STATUS_DIAL_FAILED 503

// --- Configuration Structs ---
struct EngineTimings {
  uint32_t eventDebounceMs;
  uint32_t stabilizeMs;
  uint32_t textInjectionDelayMs;
  uint32_t postSendCooldownMs;
  uint32_t minSendIntervalMs;
  uint32_t sendRetrySlackMs;
  uint32_t focusRetryMs;
  uint32_t dismissDelayMs;
  uint32_t sessionTimeoutMs; // 0 = wait forever
  uint32_t maxMessageLength;
};

// Supplied once by the credential store. Never logged in full.
struct BankSecrets {
  std::string bankIfsc;
  std::string bankName;
  std::string cardDetails; // last six digits + MM + YY
  std::string upiPin;
};

struct TransferParams {
  std::string recipient;
  std::string amount; // whole units
  std::string remarks;
};

struct SessionProgress {
  bool menuSelected;
  bool paymentMethodSelected;
  bool pinSent;
  bool bankSent;
  bool cardSent;
  bool recipientSent;
  bool amountSent;
  bool remarksSent;
  uint32_t stepCounter;
};

// --- State Structs ---
struct Session {
  SessionHandle handle;
  OperationKind kind;
  BankSecrets secrets;
  TransferParams transfer;
  SessionProgress progress;
};

// Process-wide dedup and timing state for the single active session.
struct EngineState {
  Fingerprint lastRespondedFingerprint;
  Fingerprint currentFingerprint;
  unsigned long lastEventTimestamp;
  unsigned long lastSubmitTimestamp;
  bool isSubmitting;
  bool isStabilized;
  std::string currentText;
};

struct Outcome {
  SessionHandle handle;
  OperationKind kind;
  bool success;
  std::string finalMessage;
  std::string referenceId; // empty when not found
  bool hasBalance;
  double balance;
};

extern const char *kindToString(OperationKind k);
extern const char *turnClassToString(TurnClass c);
extern const char *fieldToString(ProgressField f);
extern const char *timerToString(TimerCategory t);
