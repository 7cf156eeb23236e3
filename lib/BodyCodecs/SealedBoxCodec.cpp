/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/SealedBoxCodec.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <sodium.h>
#include <vector>

#include "SealedBoxCodec.h"
#include "TypeChain.h"

// =================================================================================
// SECTION: RAW HELPERS
// =================================================================================

bool SealedBoxCodec::sealBytes(const std::string& plain, const PublicKey& publicKey, std::string& out) {
    if (!CryptoBox::initCrypto()) return false;

    std::vector<unsigned char> buf(plain.size() + crypto_box_SEALBYTES);
    if (crypto_box_seal(buf.data(), (const unsigned char*)plain.data(), plain.size(), publicKey.bytes) != 0) {
        return false;
    }
    out.assign((const char*)buf.data(), buf.size());
    return true;
}

bool SealedBoxCodec::openBytes(const std::string& sealed, const PublicKey& publicKey, const SecretKey& secretKey,
                               std::string& out) {
    if (!CryptoBox::initCrypto()) return false;
    if (sealed.size() < crypto_box_SEALBYTES) return false;

    std::vector<unsigned char> buf(sealed.size() - crypto_box_SEALBYTES + 1);
    if (crypto_box_seal_open(buf.data(), (const unsigned char*)sealed.data(), sealed.size(), publicKey.bytes,
                             secretKey.bytes) != 0) {
        sodium_memzero(buf.data(), buf.size());
        return false;
    }
    out.assign((const char*)buf.data(), sealed.size() - crypto_box_SEALBYTES);
    sodium_memzero(buf.data(), buf.size());
    return true;
}

// =================================================================================
// SECTION: ENCRYPTION
// =================================================================================

CodecError SealedBoxCodec::encrypt(HttpMessage& msg, const PublicKey& publicKey) {
    std::string sealed;
    if (!sealBytes(msg.body, publicKey, sealed)) return CODEC_INVALID_DATA;

    msg.body.swap(sealed);
    return CODEC_OK;
}

CodecError SealedBoxCodec::encryptWithType(HttpMessage& msg, const PublicKey& publicKey, const std::string& mimetype) {
    if (!HeaderMap::isValidValue(mimetype) || mimetype.empty()) return CODEC_INVALID_TYPE;

    std::string sealed;
    if (!sealBytes(msg.body, publicKey, sealed)) return CODEC_INVALID_DATA;

    if (!msg.setHeader(HEADER_CONTENT_TYPE, mimetype)) return CODEC_INVALID_TYPE;
    msg.body.swap(sealed);
    return CODEC_OK;
}

CodecError SealedBoxCodec::encryptAutoType(HttpMessage& msg, const PublicKey& publicKey) {
    std::string outerType;
    if (!TypeChain::wrapType(msg, SUBTYPE_SEALEDBOX, outerType)) return CODEC_INVALID_TYPE;

    std::string sealed;
    if (!sealBytes(msg.body, publicKey, sealed)) return CODEC_INVALID_DATA;

    if (!msg.setHeader(HEADER_CONTENT_TYPE, outerType)) return CODEC_INVALID_TYPE;
    msg.body.swap(sealed);
    return CODEC_OK;
}

// =================================================================================
// SECTION: DECRYPTION
// =================================================================================

CodecError SealedBoxCodec::decrypt(HttpMessage& msg, const PublicKey& publicKey, const SecretKey& secretKey) {
    std::string plain;
    if (!openBytes(msg.body, publicKey, secretKey, plain)) return CODEC_INVALID_DATA;

    msg.body.swap(plain);
    return CODEC_OK;
}

CodecError SealedBoxCodec::decryptWithType(HttpMessage& msg, const PublicKey& publicKey, const SecretKey& secretKey,
                                           const std::string& mimetype) {
    if (!msg.isHeader(HEADER_CONTENT_TYPE, mimetype)) return CODEC_INVALID_TYPE;
    return decrypt(msg, publicKey, secretKey);
}

CodecError SealedBoxCodec::decryptAutoType(HttpMessage& msg, const PublicKey& publicKey, const SecretKey& secretKey) {
    std::string innerType;
    if (!TypeChain::unwrapType(msg, SUBTYPE_SEALEDBOX, innerType)) return CODEC_INVALID_TYPE;

    std::string plain;
    if (!openBytes(msg.body, publicKey, secretKey, plain)) return CODEC_INVALID_DATA;

    if (!msg.setHeader(HEADER_CONTENT_TYPE, innerType)) return CODEC_INVALID_TYPE;
    msg.body.swap(plain);
    return CODEC_OK;
}
