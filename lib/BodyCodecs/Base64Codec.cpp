/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/Base64Codec.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <sodium.h>
#include <vector>

#include "Base64Codec.h"
#include "TypeChain.h"

#define B64_VARIANT sodium_base64_VARIANT_ORIGINAL

// =================================================================================
// SECTION: RAW HELPERS
// =================================================================================

std::string Base64Codec::encodeBytes(const uint8_t* data, size_t len) {
    size_t encodedLen = sodium_base64_ENCODED_LEN(len, B64_VARIANT);
    std::vector<char> buf(encodedLen);

    // Output is always NUL terminated
    sodium_bin2base64(buf.data(), encodedLen, data, len, B64_VARIANT);
    return std::string(buf.data());
}

std::string Base64Codec::encodeBytes(const std::string& data) {
    return encodeBytes((const uint8_t*)data.data(), data.size());
}

bool Base64Codec::decodeBytes(const std::string& text, std::string& out) {
    if (text.empty()) {
        out.clear();
        return true;
    }

    std::vector<unsigned char> buf(text.size() / 4 * 3 + 3);
    size_t binLen = 0;

    // b64_end == NULL: trailing garbage is an error
    if (sodium_base642bin(buf.data(), buf.size(), text.data(), text.size(), NULL, &binLen, NULL, B64_VARIANT) != 0) {
        return false;
    }
    out.assign((const char*)buf.data(), binLen);
    return true;
}

// =================================================================================
// SECTION: DECODING
// =================================================================================

CodecError Base64Codec::decode(HttpMessage& msg) {
    std::string decoded;
    if (!decodeBytes(msg.body, decoded)) return CODEC_INVALID_DATA;

    msg.body.swap(decoded);
    return CODEC_OK;
}

CodecError Base64Codec::decodeWithType(HttpMessage& msg, const std::string& mimetype) {
    if (!msg.isHeader(HEADER_CONTENT_TYPE, mimetype)) return CODEC_INVALID_TYPE;
    return decode(msg);
}

CodecError Base64Codec::decodeAutoType(HttpMessage& msg) {
    std::string innerType;
    if (!TypeChain::unwrapType(msg, SUBTYPE_BASE64, innerType)) return CODEC_INVALID_TYPE;

    std::string decoded;
    if (!decodeBytes(msg.body, decoded)) return CODEC_INVALID_DATA;

    if (!msg.setHeader(HEADER_CONTENT_TYPE, innerType)) return CODEC_INVALID_TYPE;
    msg.body.swap(decoded);
    return CODEC_OK;
}

// =================================================================================
// SECTION: ENCODING
// =================================================================================

CodecError Base64Codec::encode(HttpMessage& msg) {
    msg.body = encodeBytes(msg.body);
    return CODEC_OK;
}

CodecError Base64Codec::encodeWithType(HttpMessage& msg, const std::string& mimetype) {
    if (!HeaderMap::isValidValue(mimetype) || mimetype.empty()) return CODEC_INVALID_TYPE;

    std::string encoded = encodeBytes(msg.body);
    if (!msg.setHeader(HEADER_CONTENT_TYPE, mimetype)) return CODEC_INVALID_TYPE;
    msg.body.swap(encoded);
    return CODEC_OK;
}

CodecError Base64Codec::encodeAutoType(HttpMessage& msg) {
    std::string outerType;
    if (!TypeChain::wrapType(msg, SUBTYPE_BASE64, outerType)) return CODEC_INVALID_TYPE;

    std::string encoded = encodeBytes(msg.body);
    if (!msg.setHeader(HEADER_CONTENT_TYPE, outerType)) return CODEC_INVALID_TYPE;
    msg.body.swap(encoded);
    return CODEC_OK;
}
