/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/KeyJson.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <string.h>

#include "Base64Codec.h"
#include "Binary.h"
#include "KeyJson.h"

// =================================================================================
// SECTION: FIELD HELPERS
// =================================================================================

bool KeyJson::readBytes(JsonVariantConst src, std::string& out, std::string& errorMsg) {
    if (!src.is<const char*>()) {
        errorMsg = "Expected a base64 string";
        return false;
    }
    if (!Base64Codec::decodeBytes(src.as<const char*>(), out)) {
        errorMsg = "Invalid base64";
        return false;
    }
    return true;
}

void KeyJson::writeBytes(const std::string& bytes, JsonVariant dst) {
    dst.set(Base64Codec::encodeBytes(bytes));
}

// All key types share the same wire form
template <typename K>
static bool readKey(JsonVariantConst src, K& out, std::string& errorMsg) {
    std::string bytes;
    if (!KeyJson::readBytes(src, bytes, errorMsg)) return false;
    if (!Binary::fromBytes(bytes, out)) {
        errorMsg = "Invalid value size";
        return false;
    }
    return true;
}

bool KeyJson::read(JsonVariantConst src, PublicKey& out, std::string& errorMsg) {
    return readKey(src, out, errorMsg);
}

bool KeyJson::read(JsonVariantConst src, SecretKey& out, std::string& errorMsg) {
    return readKey(src, out, errorMsg);
}

bool KeyJson::read(JsonVariantConst src, Key& out, std::string& errorMsg) {
    return readKey(src, out, errorMsg);
}

// =================================================================================
// SECTION: CONVERTERS
// =================================================================================

void convertToJson(const PublicKey& src, JsonVariant dst) {
    KeyJson::writeBytes(Binary::toBytes(src), dst);
}

void convertFromJson(JsonVariantConst src, PublicKey& dst) {
    std::string err;
    if (!KeyJson::read(src, dst, err)) dst = PublicKey();
}

bool canConvertFromJson(JsonVariantConst src, const PublicKey&) {
    PublicKey tmp;
    std::string err;
    return KeyJson::read(src, tmp, err);
}

void convertToJson(const SecretKey& src, JsonVariant dst) {
    KeyJson::writeBytes(Binary::toBytes(src), dst);
}

void convertFromJson(JsonVariantConst src, SecretKey& dst) {
    std::string err;
    if (!KeyJson::read(src, dst, err)) dst = SecretKey();
}

bool canConvertFromJson(JsonVariantConst src, const SecretKey&) {
    SecretKey tmp;
    std::string err;
    return KeyJson::read(src, tmp, err);
}

void convertToJson(const Key& src, JsonVariant dst) {
    KeyJson::writeBytes(Binary::toBytes(src), dst);
}

void convertFromJson(JsonVariantConst src, Key& dst) {
    std::string err;
    if (!KeyJson::read(src, dst, err)) dst = Key();
}

bool canConvertFromJson(JsonVariantConst src, const Key&) {
    Key tmp;
    std::string err;
    return KeyJson::read(src, tmp, err);
}
