/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration validation, key management and saving.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Config.h"
#include "HeaderMap.h"
#include "KeyJson.h"
#include "Logger.h"
#include <errno.h>
#include <fstream>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>

// Helper for logging
void SettingsManager::log(const char *key, const char *val) { logKeyValue(key, val); }

// =================================================================================
// SECTION: DEFAULTS
// =================================================================================

void SettingsManager::applyDefaults(ApiSettings &settings) {
  settings.vendorType = ILLUMIUM_DEFAULT_VENDOR_TYPE;
  settings.maxBodyLength = ILLUMIUM_DEFAULT_MAX_BODY;
  settings.trustProxyHeaders = false;
}

// =================================================================================
// SECTION: VALIDATED SETTERS
// =================================================================================

bool SettingsManager::isValidVendorType(const std::string &vendorType) {
  size_t slash = vendorType.find('/');
  if (slash == std::string::npos || vendorType.find('+') != std::string::npos)
    return false;

  std::string type = vendorType.substr(0, slash);
  std::string subtype = vendorType.substr(slash + 1);

  // isValidName rejects empty strings and a second '/'
  return HeaderMap::isValidName(type) && HeaderMap::isValidName(subtype);
}

bool SettingsManager::setVendorType(ApiSettings &settings, const std::string &vendorType, std::string &errorMsg) {
  if (!isValidVendorType(vendorType)) {
    errorMsg = "vendorType must be 'type/subtype' without '+': " + vendorType;
    return false;
  }
  settings.vendorType = vendorType;

  char logBuf[MAX_LOG_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "Vendor Type: %s", vendorType.c_str());
  log("Settings", logBuf);
  return true;
}

uint32_t SettingsManager::setMaxBodyLength(ApiSettings &settings, uint32_t length) {
  uint32_t finalValue = length;
  const char *note = "";

  if (finalValue < ILLUMIUM_ABS_MIN_BODY) {
    finalValue = ILLUMIUM_ABS_MIN_BODY;
    note = " (Clamped Min)";
  } else if (finalValue > ILLUMIUM_ABS_MAX_BODY) {
    finalValue = ILLUMIUM_ABS_MAX_BODY;
    note = " (Clamped Max)";
  }

  settings.maxBodyLength = finalValue;

  char logBuf[128];
  if (length != finalValue) {
    snprintf(logBuf, sizeof(logBuf), "Max Body: %u B%s (Req: %u)", finalValue, note, length);
  } else {
    snprintf(logBuf, sizeof(logBuf), "Max Body: %u B", finalValue);
  }
  log("Settings", logBuf);

  return finalValue;
}

// =================================================================================
// SECTION: JSON MAPPING
// =================================================================================

bool SettingsManager::fromJson(JsonVariantConst src, ApiSettings &out, bool &changed, std::string &errorMsg) {
  if (!src.is<JsonObjectConst>()) {
    errorMsg = "Settings root must be a JSON object.";
    return false;
  }

  ApiSettings tmp;
  applyDefaults(tmp);
  bool modified = false;

  // 1. Vendor type
  JsonVariantConst vendor = src["vendorType"];
  if (vendor.isNull()) {
    modified = true;
  } else if (!vendor.is<const char *>()) {
    errorMsg = "vendorType must be a string.";
    return false;
  } else if (!setVendorType(tmp, vendor.as<const char *>(), errorMsg)) {
    return false;
  }

  // 2. Body limit
  JsonVariantConst maxBody = src["maxBodyLength"];
  if (maxBody.isNull()) {
    modified = true;
  } else if (maxBody.is<uint32_t>()) {
    uint32_t requested = maxBody.as<uint32_t>();
    if (setMaxBodyLength(tmp, requested) != requested)
      modified = true;
  } else if (maxBody.is<uint64_t>()) {
    // Beyond 32 bits: saturate, then clamp like any other oversize value
    setMaxBodyLength(tmp, UINT32_MAX);
    modified = true;
  } else {
    errorMsg = "maxBodyLength must be a non-negative integer.";
    return false;
  }

  // 3. Proxy headers
  JsonVariantConst trust = src["trustProxyHeaders"];
  if (trust.isNull()) {
    modified = true;
  } else if (trust.is<bool>()) {
    tmp.trustProxyHeaders = trust.as<bool>();
  } else {
    errorMsg = "trustProxyHeaders must be a boolean.";
    return false;
  }

  // 4. Key pair
  JsonVariantConst secretField = src["secretKey"];
  JsonVariantConst publicField = src["publicKey"];
  std::string keyErr;

  if (secretField.isNull()) {
    if (!publicField.isNull()) {
      errorMsg = "publicKey is set but secretKey is missing.";
      return false;
    }
    if (!CryptoBox::generateKeyPair(tmp.keys)) {
      errorMsg = "Key generation failed.";
      return false;
    }
    log("Settings", "Generated new sealed-box key pair.");
    modified = true;
  } else {
    if (!KeyJson::read(secretField, tmp.keys.secretKey, keyErr)) {
      errorMsg = "secretKey: " + keyErr;
      return false;
    }
    if (publicField.isNull()) {
      if (!CryptoBox::derivePublicKey(tmp.keys.secretKey, tmp.keys.publicKey)) {
        errorMsg = "Public key derivation failed.";
        return false;
      }
      modified = true;
    } else {
      if (!KeyJson::read(publicField, tmp.keys.publicKey, keyErr)) {
        errorMsg = "publicKey: " + keyErr;
        return false;
      }
      if (!CryptoBox::isMatchingPair(tmp.keys)) {
        errorMsg = "publicKey does not belong to secretKey.";
        return false;
      }
    }
  }

  out = tmp;
  changed = modified;
  return true;
}

void SettingsManager::toJson(const ApiSettings &settings, JsonDocument &doc) {
  doc.clear();
  doc["vendorType"] = settings.vendorType;
  doc["maxBodyLength"] = settings.maxBodyLength;
  doc["trustProxyHeaders"] = settings.trustProxyHeaders;
  doc["publicKey"] = settings.keys.publicKey;
  doc["secretKey"] = settings.keys.secretKey;
}

// =================================================================================
// SECTION: FILE STORAGE
// =================================================================================

bool SettingsManager::loadSettings(const char *path, ApiSettings &out, bool &changed, std::string &errorMsg) {
  struct stat st;
  if (stat(path, &st) != 0) {
    if (errno != ENOENT) {
      errorMsg = std::string("Cannot access settings file: ") + strerror(errno);
      return false;
    }

    // First start: defaults plus a new key pair
    log("Settings", "No settings file. Using defaults.");
    ApiSettings tmp;
    applyDefaults(tmp);
    if (!CryptoBox::generateKeyPair(tmp.keys)) {
      errorMsg = "Key generation failed.";
      return false;
    }
    log("Settings", "Generated new sealed-box key pair.");
    out = tmp;
    changed = true;
    return true;
  }

  std::ifstream in(path);
  if (!in.is_open()) {
    errorMsg = std::string("Cannot open settings file: ") + path;
    return false;
  }

  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, in);
  if (error) {
    errorMsg = std::string("Invalid settings JSON: ") + error.c_str();
    return false;
  }

  if (!fromJson(doc.as<JsonVariantConst>(), out, changed, errorMsg))
    return false;

  char logBuf[MAX_LOG_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "Loaded %s", path);
  log("Settings", logBuf);
  return true;
}

bool SettingsManager::saveSettings(const char *path, const ApiSettings &settings, std::string &errorMsg) {
  JsonDocument doc;
  toJson(settings, doc);
  if (doc.overflowed()) {
    errorMsg = "Settings document overflowed.";
    return false;
  }

  // Write a sibling file first so a failed write keeps the old settings
  std::string tmpPath = std::string(path) + ".tmp";
  {
    std::ofstream file(tmpPath.c_str(), std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      errorMsg = "Cannot write settings file: " + tmpPath;
      return false;
    }
    serializeJsonPretty(doc, file);
    file << "\n";
    file.flush();
    if (!file.good()) {
      errorMsg = "Write error on " + tmpPath;
      file.close();
      remove(tmpPath.c_str());
      return false;
    }
  }

  if (rename(tmpPath.c_str(), path) != 0) {
    errorMsg = std::string("Cannot replace settings file: ") + strerror(errno);
    remove(tmpPath.c_str());
    return false;
  }

  log("Settings", "Settings saved.");
  return true;
}
