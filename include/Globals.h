/*
 * =================================================================================
 * Project:   Illumium API
 * File:      Globals.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Shared global state: the active settings and the mutex guarding them and
 * the log buffers.
 * =================================================================================
 */
#ifndef GLOBALS_H
#define GLOBALS_H

#include <mutex>

#include "Config.h"
#include "SettingsManager.h"

// =================================================================================
// SECTION: SYNCHRONIZATION
// =================================================================================
extern std::recursive_timed_mutex stateMutex;

// =================================================================================
// SECTION: STATE MANAGEMENT
// =================================================================================
extern ApiSettings g_apiSettings;

#endif
