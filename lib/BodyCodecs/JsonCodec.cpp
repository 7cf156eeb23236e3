/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/JsonCodec.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <ctype.h>
#include <sstream>

#include "JsonCodec.h"
#include "TypeChain.h"

// =================================================================================
// SECTION: DECODING
// =================================================================================

bool JsonCodec::parse(const std::string& text, JsonDocument& out) {
    JsonDocument doc;
    std::istringstream in(text);

    DeserializationError err = deserializeJson(doc, in);
    if (err) return false;

    // The stream reader stops after the first value
    int c;
    while ((c = in.get()) != EOF) {
        if (!isspace(c)) return false;
    }

    out = doc;
    return !out.overflowed();
}

CodecError JsonCodec::decode(const HttpMessage& msg, JsonDocument& out) {
    return parse(msg.body, out) ? CODEC_OK : CODEC_INVALID_DATA;
}

CodecError JsonCodec::decodeWithType(const HttpMessage& msg, const std::string& mimetype, JsonDocument& out) {
    if (!msg.isHeader(HEADER_CONTENT_TYPE, mimetype)) return CODEC_INVALID_TYPE;
    return decode(msg, out);
}

CodecError JsonCodec::decodeAutoType(HttpMessage& msg, JsonDocument& out) {
    std::string innerType;
    if (!TypeChain::unwrapType(msg, SUBTYPE_JSON, innerType)) return CODEC_INVALID_TYPE;

    JsonDocument doc;
    if (!parse(msg.body, doc)) return CODEC_INVALID_DATA;

    if (!msg.setHeader(HEADER_CONTENT_TYPE, innerType)) return CODEC_INVALID_TYPE;
    out = doc;
    return CODEC_OK;
}

// =================================================================================
// SECTION: ENCODING
// =================================================================================

CodecError JsonCodec::encode(HttpMessage& msg, const JsonDocument& value) {
    if (value.overflowed()) return CODEC_INVALID_DATA;

    std::string text;
    serializeJson(value, text);
    msg.body.swap(text);
    return CODEC_OK;
}

CodecError JsonCodec::encodeWithType(HttpMessage& msg, const JsonDocument& value, const std::string& mimetype) {
    if (!HeaderMap::isValidValue(mimetype) || mimetype.empty()) return CODEC_INVALID_TYPE;
    if (value.overflowed()) return CODEC_INVALID_DATA;

    if (!msg.setHeader(HEADER_CONTENT_TYPE, mimetype)) return CODEC_INVALID_TYPE;
    return encode(msg, value);
}

CodecError JsonCodec::encodeAutoType(HttpMessage& msg, const JsonDocument& value) {
    std::string outerType;
    if (!TypeChain::wrapType(msg, SUBTYPE_JSON, outerType)) return CODEC_INVALID_TYPE;
    if (value.overflowed()) return CODEC_INVALID_DATA;

    if (!msg.setHeader(HEADER_CONTENT_TYPE, outerType)) return CODEC_INVALID_TYPE;
    return encode(msg, value);
}
