/*
 * File: test/test_settings/test_settings.cpp
 * Description: Unit tests for settings validation, key handling and file storage.
 */
#include <unity.h>
#include <stdio.h>
#include <unistd.h>
#include <fstream>
#include <string>
#include <ArduinoJson.h>
#include "Config.h"
#include "KeyJson.h"
#include "LogCapture.h"
#include "SettingsManager.h"

static LogCapture* logs = NULL;
static char settingsPath[64];

static bool parse(const char* text, JsonDocument& doc) {
    return !deserializeJson(doc, text);
}

static void writeFile(const char* path, const char* text) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << text;
}

// ============================================================================
// VALIDATION TESTS
// ============================================================================

void test_defaults(void) {
    ApiSettings s;
    s.vendorType = "x/y";
    s.maxBodyLength = 1;
    s.trustProxyHeaders = true;

    SettingsManager::applyDefaults(s);
    TEST_ASSERT_EQUAL_STRING(ILLUMIUM_DEFAULT_VENDOR_TYPE, s.vendorType.c_str());
    TEST_ASSERT_EQUAL(ILLUMIUM_DEFAULT_MAX_BODY, s.maxBodyLength);
    TEST_ASSERT_FALSE(s.trustProxyHeaders);
}

void test_vendor_type_validation(void) {
    TEST_ASSERT_TRUE(SettingsManager::isValidVendorType("application/vnd.illumium.v1"));
    TEST_ASSERT_TRUE(SettingsManager::isValidVendorType("application/json"));

    TEST_ASSERT_FALSE(SettingsManager::isValidVendorType("application"));
    TEST_ASSERT_FALSE(SettingsManager::isValidVendorType("application/vnd+json"));
    TEST_ASSERT_FALSE(SettingsManager::isValidVendorType("/json"));
    TEST_ASSERT_FALSE(SettingsManager::isValidVendorType("application/"));
    TEST_ASSERT_FALSE(SettingsManager::isValidVendorType("a/b/c"));
    TEST_ASSERT_FALSE(SettingsManager::isValidVendorType("app lication/json"));
}

void test_set_vendor_type(void) {
    ApiSettings s;
    SettingsManager::applyDefaults(s);
    std::string err;

    TEST_ASSERT_FALSE(SettingsManager::setVendorType(s, "bad+type/x", err));
    TEST_ASSERT_EQUAL_STRING("vendorType must be 'type/subtype' without '+': bad+type/x", err.c_str());
    TEST_ASSERT_EQUAL_STRING(ILLUMIUM_DEFAULT_VENDOR_TYPE, s.vendorType.c_str());

    TEST_ASSERT_TRUE(SettingsManager::setVendorType(s, "application/vnd.acme.v2", err));
    TEST_ASSERT_EQUAL_STRING("application/vnd.acme.v2", s.vendorType.c_str());
    TEST_ASSERT_TRUE(logs->contains("Vendor Type: application/vnd.acme.v2"));
}

void test_max_body_clamping(void) {
    ApiSettings s;
    SettingsManager::applyDefaults(s);

    TEST_ASSERT_EQUAL(ILLUMIUM_ABS_MIN_BODY, SettingsManager::setMaxBodyLength(s, 10));
    TEST_ASSERT_TRUE(logs->contains("(Clamped Min) (Req: 10)"));

    TEST_ASSERT_EQUAL(ILLUMIUM_ABS_MAX_BODY, SettingsManager::setMaxBodyLength(s, ILLUMIUM_ABS_MAX_BODY + 1));
    TEST_ASSERT_TRUE(logs->contains("(Clamped Max)"));

    TEST_ASSERT_EQUAL(4096, SettingsManager::setMaxBodyLength(s, 4096));
    TEST_ASSERT_EQUAL(4096, s.maxBodyLength);
    TEST_ASSERT_TRUE(logs->contains("Max Body: 4096 B"));
}

// ============================================================================
// JSON MAPPING TESTS
// ============================================================================

void test_empty_object_fills_defaults_and_keys(void) {
    JsonDocument doc;
    TEST_ASSERT_TRUE(parse("{}", doc));

    ApiSettings s;
    bool changed = false;
    std::string err;
    TEST_ASSERT_TRUE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_EQUAL_STRING(ILLUMIUM_DEFAULT_VENDOR_TYPE, s.vendorType.c_str());
    TEST_ASSERT_TRUE(CryptoBox::isMatchingPair(s.keys));
    TEST_ASSERT_TRUE(logs->contains("Generated new sealed-box key pair."));
}

void test_round_trip_unchanged(void) {
    ApiSettings original;
    SettingsManager::applyDefaults(original);
    original.trustProxyHeaders = true;
    original.maxBodyLength = 2048;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(original.keys));

    JsonDocument doc;
    SettingsManager::toJson(original, doc);

    ApiSettings loaded;
    bool changed = true;
    std::string err;
    TEST_ASSERT_TRUE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), loaded, changed, err));
    TEST_ASSERT_FALSE(changed);
    TEST_ASSERT_TRUE(loaded.trustProxyHeaders);
    TEST_ASSERT_EQUAL(2048, loaded.maxBodyLength);
    TEST_ASSERT_TRUE(loaded.keys.publicKey == original.keys.publicKey);
    TEST_ASSERT_TRUE(loaded.keys.secretKey == original.keys.secretKey);
}

void test_clamped_value_marks_changed(void) {
    JsonDocument doc;
    ApiSettings keyed;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(keyed.keys));
    SettingsManager::applyDefaults(keyed);
    SettingsManager::toJson(keyed, doc);
    doc["maxBodyLength"] = 1;

    ApiSettings s;
    bool changed = false;
    std::string err;
    TEST_ASSERT_TRUE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_EQUAL(ILLUMIUM_ABS_MIN_BODY, s.maxBodyLength);
}

void test_oversized_64bit_value_clamped(void) {
    JsonDocument doc;
    TEST_ASSERT_TRUE(parse("{\"maxBodyLength\":5000000000}", doc));

    ApiSettings s;
    bool changed = false;
    std::string err;
    TEST_ASSERT_TRUE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_EQUAL(ILLUMIUM_ABS_MAX_BODY, s.maxBodyLength);
    TEST_ASSERT_TRUE(logs->contains("(Clamped Max)"));
}

void test_secret_only_derives_public(void) {
    KeyPair pair;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(pair));

    JsonDocument doc;
    doc["secretKey"] = pair.secretKey;

    ApiSettings s;
    bool changed = false;
    std::string err;
    TEST_ASSERT_TRUE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_TRUE(s.keys.publicKey == pair.publicKey);
}

void test_rejects_bad_fields(void) {
    ApiSettings s;
    SettingsManager::applyDefaults(s);
    bool changed = false;
    std::string err;
    JsonDocument doc;

    TEST_ASSERT_TRUE(parse("[]", doc));
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("Settings root must be a JSON object.", err.c_str());

    TEST_ASSERT_TRUE(parse("{\"vendorType\":5}", doc));
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("vendorType must be a string.", err.c_str());

    TEST_ASSERT_TRUE(parse("{\"vendorType\":\"text\"}", doc));
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("vendorType must be 'type/subtype' without '+': text", err.c_str());

    TEST_ASSERT_TRUE(parse("{\"maxBodyLength\":-5}", doc));
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("maxBodyLength must be a non-negative integer.", err.c_str());

    TEST_ASSERT_TRUE(parse("{\"trustProxyHeaders\":\"yes\"}", doc));
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("trustProxyHeaders must be a boolean.", err.c_str());

    // Failed loads leave the target alone
    TEST_ASSERT_EQUAL_STRING(ILLUMIUM_DEFAULT_VENDOR_TYPE, s.vendorType.c_str());
}

void test_rejects_bad_keys(void) {
    ApiSettings s;
    bool changed = false;
    std::string err;
    JsonDocument doc;

    KeyPair a, b;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(a));
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(b));

    doc.clear();
    doc["publicKey"] = a.publicKey;
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("publicKey is set but secretKey is missing.", err.c_str());

    doc.clear();
    doc["secretKey"] = "AAAA";
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("secretKey: Invalid value size", err.c_str());

    doc.clear();
    doc["secretKey"] = a.secretKey;
    doc["publicKey"] = "@@";
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("publicKey: Invalid base64", err.c_str());

    doc.clear();
    doc["secretKey"] = a.secretKey;
    doc["publicKey"] = b.publicKey;
    TEST_ASSERT_FALSE(SettingsManager::fromJson(doc.as<JsonVariantConst>(), s, changed, err));
    TEST_ASSERT_EQUAL_STRING("publicKey does not belong to secretKey.", err.c_str());
}

// ============================================================================
// FILE STORAGE TESTS
// ============================================================================

void test_missing_file_generates_settings(void) {
    ApiSettings s;
    bool changed = false;
    std::string err;
    TEST_ASSERT_TRUE(SettingsManager::loadSettings(settingsPath, s, changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_TRUE(CryptoBox::isMatchingPair(s.keys));
    TEST_ASSERT_TRUE(logs->contains("No settings file. Using defaults."));
}

void test_save_then_load(void) {
    ApiSettings s;
    SettingsManager::applyDefaults(s);
    s.vendorType = "application/vnd.acme.v2";
    s.maxBodyLength = 8192;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(s.keys));

    std::string err;
    TEST_ASSERT_TRUE(SettingsManager::saveSettings(settingsPath, s, err));
    TEST_ASSERT_TRUE(logs->contains("Settings saved."));

    // No leftover temp file
    std::string tmpPath = std::string(settingsPath) + ".tmp";
    TEST_ASSERT_NOT_EQUAL(0, access(tmpPath.c_str(), F_OK));

    ApiSettings loaded;
    bool changed = true;
    TEST_ASSERT_TRUE(SettingsManager::loadSettings(settingsPath, loaded, changed, err));
    TEST_ASSERT_FALSE(changed);
    TEST_ASSERT_EQUAL_STRING("application/vnd.acme.v2", loaded.vendorType.c_str());
    TEST_ASSERT_EQUAL(8192, loaded.maxBodyLength);
    TEST_ASSERT_TRUE(loaded.keys.secretKey == s.keys.secretKey);
}

void test_load_invalid_json(void) {
    writeFile(settingsPath, "{ not json");

    ApiSettings s;
    bool changed = false;
    std::string err;
    TEST_ASSERT_FALSE(SettingsManager::loadSettings(settingsPath, s, changed, err));
    TEST_ASSERT_EQUAL(0, err.find("Invalid settings JSON: "));
}

void test_save_to_missing_directory(void) {
    ApiSettings s;
    SettingsManager::applyDefaults(s);

    std::string err;
    TEST_ASSERT_FALSE(SettingsManager::saveSettings("/nonexistent-dir/illumium/settings.json", s, err));
    TEST_ASSERT_EQUAL(0, err.find("Cannot write settings file: "));
}

// ============================================================================
// MAIN
// ============================================================================

void setUp(void) {
    logs = new LogCapture();
    remove(settingsPath);
}

void tearDown(void) {
    remove(settingsPath);
    delete logs;
    logs = NULL;
}

int main(void) {
    if (!CryptoBox::initCrypto()) return 1;
    snprintf(settingsPath, sizeof(settingsPath), "/tmp/illumium-settings-test-%d.json", (int)getpid());

    UNITY_BEGIN();

    // Validation
    RUN_TEST(test_defaults);
    RUN_TEST(test_vendor_type_validation);
    RUN_TEST(test_set_vendor_type);
    RUN_TEST(test_max_body_clamping);

    // JSON Mapping
    RUN_TEST(test_empty_object_fills_defaults_and_keys);
    RUN_TEST(test_round_trip_unchanged);
    RUN_TEST(test_clamped_value_marks_changed);
    RUN_TEST(test_oversized_64bit_value_clamped);
    RUN_TEST(test_secret_only_derives_public);
    RUN_TEST(test_rejects_bad_fields);
    RUN_TEST(test_rejects_bad_keys);

    // File Storage
    RUN_TEST(test_missing_file_generates_settings);
    RUN_TEST(test_save_then_load);
    RUN_TEST(test_load_invalid_json);
    RUN_TEST(test_save_to_missing_directory);

    return UNITY_END();
}
