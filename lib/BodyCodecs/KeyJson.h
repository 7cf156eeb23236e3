/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/KeyJson.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * ArduinoJson converters for key types. Keys travel as base64 strings:
 *   doc["publicKey"] = keys.publicKey;
 *   if (doc["publicKey"].is<PublicKey>()) pk = doc["publicKey"].as<PublicKey>();
 * KeyJson::read() gives the reason when a field does not convert.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>

#include "CryptoKeys.h"

// --- ArduinoJson custom converters ---
void convertToJson(const PublicKey& src, JsonVariant dst);
void convertFromJson(JsonVariantConst src, PublicKey& dst);
bool canConvertFromJson(JsonVariantConst src, const PublicKey&);

void convertToJson(const SecretKey& src, JsonVariant dst);
void convertFromJson(JsonVariantConst src, SecretKey& dst);
bool canConvertFromJson(JsonVariantConst src, const SecretKey&);

void convertToJson(const Key& src, JsonVariant dst);
void convertFromJson(JsonVariantConst src, Key& dst);
bool canConvertFromJson(JsonVariantConst src, const Key&);

class KeyJson {
public:
    // Decodes a base64 key field. errorMsg is "Invalid value size" when the
    // decoded length is wrong.
    static bool read(JsonVariantConst src, PublicKey& out, std::string& errorMsg);
    static bool read(JsonVariantConst src, SecretKey& out, std::string& errorMsg);
    static bool read(JsonVariantConst src, Key& out, std::string& errorMsg);

    // Base64 field holding arbitrary bytes.
    static bool readBytes(JsonVariantConst src, std::string& out, std::string& errorMsg);
    static void writeBytes(const std::string& bytes, JsonVariant dst);
};
