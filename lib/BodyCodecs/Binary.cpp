/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/Binary.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "Binary.h"

std::string Binary::toBytes(const std::vector<uint8_t>& value) {
    return std::string(value.begin(), value.end());
}

std::string Binary::toBytes(const PublicKey& value) {
    return std::string((const char*)value.bytes, KEY_BYTES);
}

std::string Binary::toBytes(const SecretKey& value) {
    return std::string((const char*)value.bytes, KEY_BYTES);
}

std::string Binary::toBytes(const Key& value) {
    return std::string((const char*)value.bytes, KEY_BYTES);
}

bool Binary::fromBytes(const std::string& bytes, std::string& out) {
    out = bytes;
    return true;
}

bool Binary::fromBytes(const std::string& bytes, std::vector<uint8_t>& out) {
    out.assign(bytes.begin(), bytes.end());
    return true;
}

bool Binary::fromBytes(const std::string& bytes, PublicKey& out) {
    return PublicKey::fromSlice((const uint8_t*)bytes.data(), bytes.size(), out);
}

bool Binary::fromBytes(const std::string& bytes, SecretKey& out) {
    return SecretKey::fromSlice((const uint8_t*)bytes.data(), bytes.size(), out);
}

bool Binary::fromBytes(const std::string& bytes, Key& out) {
    return Key::fromSlice((const uint8_t*)bytes.data(), bytes.size(), out);
}
