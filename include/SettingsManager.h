/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for API configuration and storage.
 * - Reads and writes the JSON settings file.
 * - Validates inputs against limits (clamping with a log line).
 * - Owns the sealed-box key pair (generated when missing).
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <stdint.h>
#include <string>

#include "CryptoKeys.h"

struct ApiSettings {
  std::string vendorType;
  uint32_t maxBodyLength;
  bool trustProxyHeaders;
  KeyPair keys;
};

class SettingsManager {
public:
  // --- Defaults ---
  // Everything except the keys.
  static void applyDefaults(ApiSettings &settings);

  // --- File Storage ---
  // Missing file: defaults plus a fresh key pair, 'changed' set.
  // Unreadable or invalid file: false with errorMsg.
  static bool loadSettings(const char *path, ApiSettings &out, bool &changed, std::string &errorMsg);
  static bool saveSettings(const char *path, const ApiSettings &settings, std::string &errorMsg);

  // --- JSON Mapping ---
  static bool fromJson(JsonVariantConst src, ApiSettings &out, bool &changed, std::string &errorMsg);
  static void toJson(const ApiSettings &settings, JsonDocument &doc);

  // --- Validated Setters ---
  static bool setVendorType(ApiSettings &settings, const std::string &vendorType, std::string &errorMsg);
  static uint32_t setMaxBodyLength(ApiSettings &settings, uint32_t length);

  // "type/subtype" with token characters only and no '+'.
  static bool isValidVendorType(const std::string &vendorType);

private:
  static void log(const char *key, const char *value);
};
