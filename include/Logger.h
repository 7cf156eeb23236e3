/*
 * =================================================================================
 * Project:   Illumium API
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Thread-safe logging system. Manages a ring buffer for storing logs in memory,
 * allowing them to be retrieved via the Web API or printed to the console.
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <vector>

// =================================================================================
// SECTION: LOGGING CONSTANTS & MACROS
// =================================================================================
#define LOG_SEP_MAJOR "=========================================================================="
#define LOG_SEP_MINOR "--------------------------------------------------------------------------"

// =================================================================================
// SECTION: CORE LOGGING FUNCTIONS
// =================================================================================
void logMessage(const char *message);
void logKeyValue(const char *key, const char *value);

// Drains up to LOG_DRAIN_LINES queued lines to stderr.
void processLogQueue();

// =================================================================================
// SECTION: BUFFER ACCESS (FOR API)
// =================================================================================

// Oldest first.
void getLogLines(std::vector<std::string> &out);
void clearLogs();

#endif
