/*
 * =================================================================================
 * Project:   Illumium API
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines API identification, the default vendor
 * media type, body size limits and logging buffer sizes.
 * =================================================================================
 */
#pragma once

// --- API Identification ---
#define ILLUMIUM_API_NAME "illumium-api"
#define ILLUMIUM_API_VERSION "0.1.0"

// =================================================================================
// SECTION: MEDIA TYPES
// =================================================================================

// Base type of every API document. Bodies travel as
// <vendor>+json[+sealedbox][+base64].
#define ILLUMIUM_DEFAULT_VENDOR_TYPE "application/vnd.illumium.v1"
#define ILLUMIUM_TEXT_TYPE "text/plain; charset=utf-8"
#define ILLUMIUM_HTML_TYPE "text/html"
#define ILLUMIUM_JSON_TYPE "application/json"

// =================================================================================
// SECTION: LIMITS
// =================================================================================

#define ILLUMIUM_DEFAULT_MAX_BODY 65536
#define ILLUMIUM_ABS_MIN_BODY 1024     // Below this a sealed JSON document barely fits
#define ILLUMIUM_ABS_MAX_BODY 16777216 // 16 MiB

// Read size when pulling a request off stdin
#define ILLUMIUM_READ_CHUNK 4096

// =================================================================================
// SECTION: FILES
// =================================================================================

#define ILLUMIUM_DEFAULT_SETTINGS_PATH "illumium-settings.json"

// =================================================================================
// SECTION: LOGGING
// =================================================================================

#define LOG_BUFFER_SIZE 150
#define MAX_LOG_LENGTH 150
#define SERIAL_QUEUE_SIZE 50
#define LOG_LOCK_TIMEOUT_MS 100
#define LOG_DRAIN_LINES 10
