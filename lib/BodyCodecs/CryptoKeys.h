/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/CryptoKeys.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Fixed-size key types backed by libsodium:
 * - PublicKey / SecretKey : crypto_box (X25519) pair used by sealed boxes.
 * - Key                   : crypto_secretbox symmetric key.
 * Secret material is wiped with sodium_memzero on destruction.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>

#define KEY_BYTES 32

struct PublicKey {
    uint8_t bytes[KEY_BYTES];

    PublicKey();
    // Exact size only.
    static bool fromSlice(const uint8_t* data, size_t len, PublicKey& out);
    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }
};

struct SecretKey {
    uint8_t bytes[KEY_BYTES];

    SecretKey();
    SecretKey(const SecretKey& other);
    SecretKey& operator=(const SecretKey& other);
    ~SecretKey();

    static bool fromSlice(const uint8_t* data, size_t len, SecretKey& out);
    bool operator==(const SecretKey& other) const;
    bool operator!=(const SecretKey& other) const { return !(*this == other); }
};

struct Key {
    uint8_t bytes[KEY_BYTES];

    Key();
    Key(const Key& other);
    Key& operator=(const Key& other);
    ~Key();

    static bool fromSlice(const uint8_t* data, size_t len, Key& out);
    bool operator==(const Key& other) const;
    bool operator!=(const Key& other) const { return !(*this == other); }
};

struct KeyPair {
    PublicKey publicKey;
    SecretKey secretKey;
};

class CryptoBox {
public:
    // Initializes libsodium. Safe to call repeatedly.
    static bool initCrypto();

    static bool generateKeyPair(KeyPair& out);
    static bool generateKey(Key& out);

    // Public key belonging to a crypto_box secret key.
    static bool derivePublicKey(const SecretKey& secretKey, PublicKey& out);

    // True if the secret key matches the public key.
    static bool isMatchingPair(const KeyPair& pair);
};
