/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines the USSD service code, the event source
 * allow-list, default engine timings and host file locations.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Device Name String ---
#define DEVICE_NAME "UssdPilot-host"

// =================================================================================
// SECTION: USSD SERVICE
// =================================================================================

// NPCI *99# service
#define USSD_SHORT_CODE "*99#"

// Windows that host the USSD dialog. Events from anything else are ignored.
static const char *const USSD_SOURCE_PACKAGES[] = {
    "com.android.phone",
    "com.samsung.android.phone",
    "com.google.android.dialer",
    "com.android.server.telecom",
    NULL
};

// =================================================================================
// SECTION: HOST
// =================================================================================

#define LOOP_INTERVAL_MS 10
#define DEFAULT_SETTINGS_PATH "ussd_settings.json"
#define DEFAULT_CREDENTIALS_PATH "ussd_credentials.json"
#define DEFAULT_JOURNAL_PATH "ussd_transactions.jsonl"

// Exit codes of ussd_pilot
#define EXIT_OUTCOME_SUCCESS 0
#define EXIT_OUTCOME_FAILED 1
#define EXIT_CONFIG_ERROR 2

#ifdef DEBUG_MODE
// ============================================================================
// DEBUG / DEVELOPMENT DEFAULTS
// ============================================================================
static const EngineTimings DEFAULT_ENGINE_TIMINGS = {
    100,   // eventDebounceMs
    200,   // stabilizeMs
    300,   // textInjectionDelayMs
    300,   // postSendCooldownMs
    300,   // minSendIntervalMs
    100,   // sendRetrySlackMs
    200,   // focusRetryMs
    500,   // dismissDelayMs
    30000, // sessionTimeoutMs
    150    // maxMessageLength
};

#else
// ============================================================================
// PRODUCTION / RELEASE DEFAULTS
// ============================================================================
static const EngineTimings DEFAULT_ENGINE_TIMINGS = {
    100,    // eventDebounceMs
    200,    // stabilizeMs
    300,    // textInjectionDelayMs
    300,    // postSendCooldownMs
    300,    // minSendIntervalMs
    100,    // sendRetrySlackMs
    200,    // focusRetryMs
    500,    // dismissDelayMs
    120000, // sessionTimeoutMs
    150     // maxMessageLength
};
#endif
