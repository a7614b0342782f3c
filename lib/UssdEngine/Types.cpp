/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/Types.cpp
 * =================================================================================
 */

#include "Types.h"

const char *kindToString(OperationKind k) {
  switch (k) {
  case OP_BALANCE_CHECK:
    return "BALANCE_CHECK";
  case OP_SEND_MONEY:
    return "SEND_MONEY";
  case OP_LINK_BANK:
    return "LINK_BANK";
  default:
    return "UNKNOWN";
  }
}

const char *turnClassToString(TurnClass c) {
  switch (c) {
  case TURN_NEW_ERROR_TERMINAL:
    return "NEW_ERROR_TERMINAL";
  case TURN_NEW_NON_TERMINAL:
    return "NEW_NON_TERMINAL";
  case TURN_REPEAT_NON_TERMINAL:
    return "REPEAT_NON_TERMINAL";
  default:
    return "IGNORED";
  }
}

const char *fieldToString(ProgressField f) {
  switch (f) {
  case FIELD_MENU_SELECTED:
    return "menu";
  case FIELD_PAYMENT_METHOD_SELECTED:
    return "paymentMethod";
  case FIELD_PIN_SENT:
    return "pin";
  case FIELD_BANK_SENT:
    return "bank";
  case FIELD_CARD_SENT:
    return "card";
  case FIELD_RECIPIENT_SENT:
    return "recipient";
  case FIELD_AMOUNT_SENT:
    return "amount";
  case FIELD_REMARKS_SENT:
    return "remarks";
  default:
    return "none";
  }
}

const char *timerToString(TimerCategory t) {
  switch (t) {
  case TIMER_STABILIZE:
    return "stabilize";
  case TIMER_SEND_RETRY:
    return "sendRetry";
  case TIMER_FOCUS:
    return "focus";
  case TIMER_SUBMIT:
    return "submit";
  case TIMER_COOLDOWN:
    return "cooldown";
  case TIMER_DISMISS:
    return "dismiss";
  case TIMER_SESSION_TIMEOUT:
    return "sessionTimeout";
  default:
    return "unknown";
  }
}
