/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/JsonCodec.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON bodies via ArduinoJson. Decoding parses into a caller-owned document
 * and never changes the body text; only the AutoType variant rewrites the
 * Content-Type. Trailing non-whitespace after the value is rejected.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>

#include "HttpMessage.h"
#include "Types.h"

class JsonCodec {
public:
    // --- Decoding ---
    static CodecError decode(const HttpMessage& msg, JsonDocument& out);
    static CodecError decodeWithType(const HttpMessage& msg, const std::string& mimetype, JsonDocument& out);
    static CodecError decodeAutoType(HttpMessage& msg, JsonDocument& out);

    // --- Encoding ---
    // A document that overflowed (allocation failure) is CODEC_INVALID_DATA.
    static CodecError encode(HttpMessage& msg, const JsonDocument& value);
    static CodecError encodeWithType(HttpMessage& msg, const JsonDocument& value, const std::string& mimetype);
    static CodecError encodeAutoType(HttpMessage& msg, const JsonDocument& value);

private:
    static bool parse(const std::string& text, JsonDocument& out);
};
