/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/SealedBoxCodec.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Anonymous public-key encryption of message bodies (libsodium
 * crypto_box_seal). The sender needs only the recipient's public key; the
 * recipient opens the box with its key pair.
 * =================================================================================
 */
#pragma once
#include <string>

#include "CryptoKeys.h"
#include "HttpMessage.h"
#include "Types.h"

class SealedBoxCodec {
public:
    // --- Raw helpers ---
    static bool sealBytes(const std::string& plain, const PublicKey& publicKey, std::string& out);
    static bool openBytes(const std::string& sealed, const PublicKey& publicKey, const SecretKey& secretKey,
                          std::string& out);

    // --- Encryption ---
    static CodecError encrypt(HttpMessage& msg, const PublicKey& publicKey);
    static CodecError encryptWithType(HttpMessage& msg, const PublicKey& publicKey, const std::string& mimetype);
    static CodecError encryptAutoType(HttpMessage& msg, const PublicKey& publicKey);

    // --- Decryption ---
    static CodecError decrypt(HttpMessage& msg, const PublicKey& publicKey, const SecretKey& secretKey);
    static CodecError decryptWithType(HttpMessage& msg, const PublicKey& publicKey, const SecretKey& secretKey,
                                      const std::string& mimetype);
    static CodecError decryptAutoType(HttpMessage& msg, const PublicKey& publicKey, const SecretKey& secretKey);
};
