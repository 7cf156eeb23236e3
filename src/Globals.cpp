/*
 * =================================================================================
 * Project:   Illumium API
 * File:      Globals.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Definitions of shared global state variables and synchronization primitives.
 * =================================================================================
 */
#include "Globals.h"
#include "Config.h"

// =================================================================================
// SECTION: SYNCHRONIZATION
// =================================================================================

std::recursive_timed_mutex stateMutex;

// =================================================================================
// SECTION: STATE MANAGEMENT
// =================================================================================

ApiSettings g_apiSettings = {ILLUMIUM_DEFAULT_VENDOR_TYPE, ILLUMIUM_DEFAULT_MAX_BODY, false, KeyPair()};
