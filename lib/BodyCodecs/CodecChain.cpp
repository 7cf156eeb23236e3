/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/CodecChain.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "Base64Codec.h"
#include "CodecChain.h"
#include "ContentType.h"
#include "JsonCodec.h"
#include "SealedBoxCodec.h"

// =================================================================================
// SECTION: DECODE
// =================================================================================

CodecError CodecChain::decode(HttpMessage& msg, const KeyPair* keys, JsonDocument& out, std::string& errorMsg) {
    // Work on a copy so a failure deep in the chain leaves msg as it was
    HttpMessage work = msg;

    for (int layer = 0; layer < MAX_CODEC_LAYERS; layer++) {
        std::string typeStr;
        if (!work.getHeaderStr(HEADER_CONTENT_TYPE, typeStr)) {
            errorMsg = "Missing or unreadable Content-Type.";
            return CODEC_INVALID_TYPE;
        }

        std::string subtype;
        if (!ContentType(typeStr).lastSubtype(subtype)) {
            errorMsg = "Content-Type has no subtype: " + typeStr;
            return CODEC_INVALID_TYPE;
        }

        CodecError err;
        if (subtype == SUBTYPE_JSON) {
            err = JsonCodec::decodeAutoType(work, out);
            if (err != CODEC_OK) {
                errorMsg = "Body is not valid JSON.";
                return err;
            }
            msg = work;
            return CODEC_OK;
        } else if (subtype == SUBTYPE_BASE64) {
            err = Base64Codec::decodeAutoType(work);
            if (err != CODEC_OK) {
                errorMsg = "Body is not valid base64.";
                return err;
            }
        } else if (subtype == SUBTYPE_SEALEDBOX) {
            if (keys == NULL) {
                errorMsg = "Sealed bodies are not accepted.";
                return CODEC_INVALID_TYPE;
            }
            err = SealedBoxCodec::decryptAutoType(work, keys->publicKey, keys->secretKey);
            if (err != CODEC_OK) {
                errorMsg = "Sealed box could not be opened.";
                return err;
            }
        } else {
            errorMsg = "Unsupported subtype: " + subtype;
            return CODEC_INVALID_TYPE;
        }
    }

    errorMsg = "Too many encoding layers.";
    return CODEC_INVALID_TYPE;
}

// =================================================================================
// SECTION: ENCODE
// =================================================================================

CodecError CodecChain::encode(HttpMessage& msg, const JsonDocument& value, const std::vector<std::string>& layers,
                              const PublicKey* sealTo, std::string& errorMsg) {
    if (layers.size() >= MAX_CODEC_LAYERS) {
        errorMsg = "Too many encoding layers.";
        return CODEC_INVALID_TYPE;
    }

    HttpMessage work = msg;

    CodecError err = JsonCodec::encodeAutoType(work, value);
    if (err != CODEC_OK) {
        errorMsg = (err == CODEC_INVALID_TYPE) ? "Content-Type must be set before encoding." : "Value could not be serialized.";
        return err;
    }

    for (size_t i = 0; i < layers.size(); i++) {
        const std::string& layer = layers[i];

        if (layer == SUBTYPE_BASE64) {
            err = Base64Codec::encodeAutoType(work);
        } else if (layer == SUBTYPE_SEALEDBOX) {
            if (sealTo == NULL) {
                errorMsg = "A sealedbox layer needs a recipient key.";
                return CODEC_INVALID_TYPE;
            }
            err = SealedBoxCodec::encryptAutoType(work, *sealTo);
        } else {
            errorMsg = "Unsupported encoding layer: " + layer;
            return CODEC_INVALID_TYPE;
        }

        if (err != CODEC_OK) {
            errorMsg = "Encoding layer failed: " + layer;
            return err;
        }
    }

    msg = work;
    return CODEC_OK;
}
