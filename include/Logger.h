/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Thread-safe logging system. Every line goes into an in-memory history (dumped
 * to the --log file at exit) and into a console queue drained by the main loop.
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

// =================================================================================
// SECTION: LOGGING CONSTANTS & MACROS
// =================================================================================
#define LOG_SEP_MAJOR "=========================================================================="
#define LOG_SEP_MINOR "--------------------------------------------------------------------------"

#define LOG_HISTORY_LINES 150
#define LOG_LINE_LENGTH 150

// =================================================================================
// SECTION: CORE LOGGING FUNCTIONS
// =================================================================================
void logMessage(const char *message);
void processLogQueue();
void flushLogQueue(); // drains everything, for startup dumps and exit

// =================================================================================
// SECTION: RUN HISTORY
// =================================================================================
// Writes the retained history, oldest line first. Returns false if the file
// cannot be written.
bool writeLogHistory(const char *path);

#endif
