/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      src/Logger.cpp
 * =================================================================================
 */
#include "Logger.h"
#include <fstream>
#include <mutex>
#include <stdio.h>
#include <string.h>

// --- Run History ---
static char logHistory[LOG_HISTORY_LINES][LOG_LINE_LENGTH];
static int historyIndex = 0;
static bool historyWrapped = false;

// Console Log Queue (To keep stdout writes out of the lock)
static const int CONSOLE_QUEUE_SIZE = 64;
static char consoleLogQueue[CONSOLE_QUEUE_SIZE][LOG_LINE_LENGTH];
static int consoleQueueHead = 0;
static int consoleQueueTail = 0;

static std::mutex logMutex;

/**
 * Thread-safe logging. NO CONSOLE IO IN THIS FUNCTION.
 * Adds a message to the run history and pushes to the console queue.
 */
void logMessage(const char *message) {
  std::lock_guard<std::mutex> lock(logMutex);

  snprintf(logHistory[historyIndex], LOG_LINE_LENGTH, "%s", message);
  historyIndex++;
  if (historyIndex >= LOG_HISTORY_LINES) {
    historyIndex = 0;
    historyWrapped = true;
  }

  // Push to Console Queue
  int nextHead = (consoleQueueHead + 1) % CONSOLE_QUEUE_SIZE;

  if (nextHead != consoleQueueTail) {
    snprintf(consoleLogQueue[consoleQueueHead], LOG_LINE_LENGTH, "%s", message);
    consoleQueueHead = nextHead;
  }
  // Queue full: the console misses the line, the history still has it.
}

/**
 * Called in main loop to drain log queue to stdout.
 * Drains up to 10 messages per call to prevent lag/dropped logs.
 */
void processLogQueue() {
  int maxLinesToProcess = 10;

  while (maxLinesToProcess > 0) {
    char msgCopy[LOG_LINE_LENGTH];
    bool hasMessage = false;

    // 1. Quick lock to check/pop a message
    {
      std::lock_guard<std::mutex> lock(logMutex);
      if (consoleQueueHead != consoleQueueTail) {
        strncpy(msgCopy, consoleLogQueue[consoleQueueTail], LOG_LINE_LENGTH);
        msgCopy[LOG_LINE_LENGTH - 1] = '\0'; // safety null

        consoleQueueTail = (consoleQueueTail + 1) % CONSOLE_QUEUE_SIZE;
        hasMessage = true;
      }
    }

    // 2. Print OUTSIDE the lock
    if (hasMessage) {
      puts(msgCopy);
      maxLinesToProcess--;
    } else {
      break;
    }
  }
  fflush(stdout);
}

void flushLogQueue() {
  bool pending = true;
  while (pending) {
    processLogQueue();
    std::lock_guard<std::mutex> lock(logMutex);
    pending = consoleQueueHead != consoleQueueTail;
  }
}

bool writeLogHistory(const char *path) {
  static char snapshot[LOG_HISTORY_LINES][LOG_LINE_LENGTH];
  int count = 0;

  // Copy under the lock, write the file outside it.
  {
    std::lock_guard<std::mutex> lock(logMutex);
    count = historyWrapped ? LOG_HISTORY_LINES : historyIndex;
    int start = historyWrapped ? historyIndex : 0;
    for (int i = 0; i < count; i++) {
      memcpy(snapshot[i], logHistory[(start + i) % LOG_HISTORY_LINES], LOG_LINE_LENGTH);
    }
  }

  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) return false;

  for (int i = 0; i < count; i++) {
    file << snapshot[i] << '\n';
  }
  return file.good();
}
