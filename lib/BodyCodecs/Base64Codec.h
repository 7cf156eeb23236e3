/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/Base64Codec.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Base64 body encoding (standard alphabet, padded). The WithType variants
 * check/set an explicit Content-Type, the AutoType variants unwrap or wrap
 * the '+base64' subtype. On failure the message is left untouched.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "HttpMessage.h"
#include "Types.h"

class Base64Codec {
public:
    // --- Raw helpers ---
    static std::string encodeBytes(const uint8_t* data, size_t len);
    static std::string encodeBytes(const std::string& data);
    static bool decodeBytes(const std::string& text, std::string& out);

    // --- Decoding ---
    static CodecError decode(HttpMessage& msg);
    static CodecError decodeWithType(HttpMessage& msg, const std::string& mimetype);
    static CodecError decodeAutoType(HttpMessage& msg);

    // --- Encoding ---
    static CodecError encode(HttpMessage& msg);
    static CodecError encodeWithType(HttpMessage& msg, const std::string& mimetype);
    static CodecError encodeAutoType(HttpMessage& msg);
};
