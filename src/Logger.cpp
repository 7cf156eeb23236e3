#include "Logger.h"
#include "Config.h"
#include "Globals.h"
#include <chrono>
#include <stdio.h>
#include <string.h>

// --- Logging System ---
// Ring buffer for storing logs in memory.
static char logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH]; // For /log
static int logBufferIndex = 0;
static bool logBufferFull = false;

// Console Log Queue (To prevent console writes inside Mutex)
static char serialLogQueue[SERIAL_QUEUE_SIZE][MAX_LOG_LENGTH];
static int serialQueueHead = 0;
static int serialQueueTail = 0;

/**
 * Thread-safe logging. NO CONSOLE IO IN THIS FUNCTION.
 * Adds a message to the in-memory log buffer and pushes to the console queue.
 */
void logMessage(const char *message) {
  if (message == NULL)
    return;

  // Short timeout here so a stuck holder cannot stall request handling
  if (stateMutex.try_lock_for(std::chrono::milliseconds(LOG_LOCK_TIMEOUT_MS))) {

    // Update RAM ring buffer (for API)
    snprintf(logBuffer[logBufferIndex], MAX_LOG_LENGTH, "%s", message);
    logBufferIndex++;
    if (logBufferIndex >= LOG_BUFFER_SIZE) {
      logBufferIndex = 0;
      logBufferFull = true;
    }

    // Push to console queue
    int nextHead = (serialQueueHead + 1) % SERIAL_QUEUE_SIZE;

    if (nextHead != serialQueueTail) {
      snprintf(serialLogQueue[serialQueueHead], MAX_LOG_LENGTH, "%s", message);
      serialQueueHead = nextHead;
    }
    // else: queue full, the line stays in the ring buffer only

    stateMutex.unlock();
  }
}

void logKeyValue(const char *key, const char *value) {
  char line[MAX_LOG_LENGTH];
  snprintf(line, sizeof(line), " %-8s : %s", key ? key : "", value ? value : "");
  logMessage(line);
}

/**
 * Drains the console queue to stderr.
 * Drains up to LOG_DRAIN_LINES messages per call to keep each call short.
 */
void processLogQueue() {
  int maxLinesToProcess = LOG_DRAIN_LINES;

  while (maxLinesToProcess > 0) {
    char msgCopy[MAX_LOG_LENGTH];
    bool hasMessage = false;

    // 1. Quick lock to check/pop a message
    if (stateMutex.try_lock_for(std::chrono::milliseconds(5))) {
      if (serialQueueHead != serialQueueTail) {
        strncpy(msgCopy, serialLogQueue[serialQueueTail], MAX_LOG_LENGTH);
        msgCopy[MAX_LOG_LENGTH - 1] = '\0';

        serialQueueTail = (serialQueueTail + 1) % SERIAL_QUEUE_SIZE;
        hasMessage = true;
      }
      stateMutex.unlock();
    } else {
      // If we couldn't get the lock, stop trying for this cycle
      break;
    }

    // 2. Print OUTSIDE the lock
    if (hasMessage) {
      fprintf(stderr, "%s\n", msgCopy);
      maxLinesToProcess--;
    } else {
      break;
    }
  }
  fflush(stderr);
}

void getLogLines(std::vector<std::string> &out) {
  out.clear();
  std::lock_guard<std::recursive_timed_mutex> lock(stateMutex);

  int count = logBufferFull ? LOG_BUFFER_SIZE : logBufferIndex;
  int start = logBufferFull ? logBufferIndex : 0;
  for (int i = 0; i < count; i++) {
    out.push_back(logBuffer[(start + i) % LOG_BUFFER_SIZE]);
  }
}

void clearLogs() {
  std::lock_guard<std::recursive_timed_mutex> lock(stateMutex);
  logBufferIndex = 0;
  logBufferFull = false;
  serialQueueHead = 0;
  serialQueueTail = 0;
}
