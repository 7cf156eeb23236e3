/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/Binary.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Conversions between binary values and raw byte strings. Byte strings
 * convert both ways unconditionally; keys only from an exact-size input.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "CryptoKeys.h"

class Binary {
public:
    // --- To bytes ---
    static std::string toBytes(const std::string& value) { return value; }
    static std::string toBytes(const std::vector<uint8_t>& value);
    static std::string toBytes(const PublicKey& value);
    static std::string toBytes(const SecretKey& value);
    static std::string toBytes(const Key& value);

    // --- From bytes ---
    static bool fromBytes(const std::string& bytes, std::string& out);
    static bool fromBytes(const std::string& bytes, std::vector<uint8_t>& out);
    static bool fromBytes(const std::string& bytes, PublicKey& out);
    static bool fromBytes(const std::string& bytes, SecretKey& out);
    static bool fromBytes(const std::string& bytes, Key& out);
};
