/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/CodecChain.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Applies a whole subtype chain at once. A body typed
 *   application/vnd.illumium.v1+json+sealedbox+base64
 * is base64 decoded, opened, then parsed as JSON. Encoding walks the same
 * chain the other way round.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>
#include <vector>

#include "CryptoKeys.h"
#include "HttpMessage.h"
#include "Types.h"

#define MAX_CODEC_LAYERS 8

class CodecChain {
public:
    // Peels layers until 'json'. keys may be NULL if sealed bodies are not
    // accepted. On success msg holds the JSON text typed with the inner type.
    static CodecError decode(HttpMessage& msg, const KeyPair* keys, JsonDocument& out, std::string& errorMsg);

    // JSON-encodes value (Content-Type must be set), then applies 'layers'
    // in order. A 'sealedbox' layer needs sealTo.
    static CodecError encode(HttpMessage& msg, const JsonDocument& value, const std::vector<std::string>& layers,
                             const PublicKey* sealTo, std::string& errorMsg);
};
