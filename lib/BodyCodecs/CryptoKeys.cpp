/*
 * =================================================================================
 * Project:   Illumium API - Body Codecs
 * File:      lib/BodyCodecs/CryptoKeys.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <sodium.h>
#include <string.h>

#include "CryptoKeys.h"

// =================================================================================
// SECTION: PUBLIC KEY
// =================================================================================

PublicKey::PublicKey() { memset(bytes, 0, sizeof(bytes)); }

bool PublicKey::fromSlice(const uint8_t* data, size_t len, PublicKey& out) {
    if (data == NULL || len != KEY_BYTES) return false;
    memcpy(out.bytes, data, KEY_BYTES);
    return true;
}

bool PublicKey::operator==(const PublicKey& other) const {
    return memcmp(bytes, other.bytes, KEY_BYTES) == 0;
}

// =================================================================================
// SECTION: SECRET KEY
// =================================================================================

SecretKey::SecretKey() { memset(bytes, 0, sizeof(bytes)); }

SecretKey::SecretKey(const SecretKey& other) { memcpy(bytes, other.bytes, KEY_BYTES); }

SecretKey& SecretKey::operator=(const SecretKey& other) {
    if (this != &other) memcpy(bytes, other.bytes, KEY_BYTES);
    return *this;
}

SecretKey::~SecretKey() { sodium_memzero(bytes, sizeof(bytes)); }

bool SecretKey::fromSlice(const uint8_t* data, size_t len, SecretKey& out) {
    if (data == NULL || len != KEY_BYTES) return false;
    memcpy(out.bytes, data, KEY_BYTES);
    return true;
}

bool SecretKey::operator==(const SecretKey& other) const {
    return sodium_memcmp(bytes, other.bytes, KEY_BYTES) == 0;
}

// =================================================================================
// SECTION: SYMMETRIC KEY
// =================================================================================

Key::Key() { memset(bytes, 0, sizeof(bytes)); }

Key::Key(const Key& other) { memcpy(bytes, other.bytes, KEY_BYTES); }

Key& Key::operator=(const Key& other) {
    if (this != &other) memcpy(bytes, other.bytes, KEY_BYTES);
    return *this;
}

Key::~Key() { sodium_memzero(bytes, sizeof(bytes)); }

bool Key::fromSlice(const uint8_t* data, size_t len, Key& out) {
    if (data == NULL || len != KEY_BYTES) return false;
    memcpy(out.bytes, data, KEY_BYTES);
    return true;
}

bool Key::operator==(const Key& other) const {
    return sodium_memcmp(bytes, other.bytes, KEY_BYTES) == 0;
}

// =================================================================================
// SECTION: KEY GENERATION
// =================================================================================

static_assert(crypto_box_PUBLICKEYBYTES == KEY_BYTES, "crypto_box public key size");
static_assert(crypto_box_SECRETKEYBYTES == KEY_BYTES, "crypto_box secret key size");
static_assert(crypto_secretbox_KEYBYTES == KEY_BYTES, "crypto_secretbox key size");

bool CryptoBox::initCrypto() {
    // 0 = initialized now, 1 = already initialized, -1 = failure
    return sodium_init() >= 0;
}

bool CryptoBox::generateKeyPair(KeyPair& out) {
    if (!initCrypto()) return false;
    return crypto_box_keypair(out.publicKey.bytes, out.secretKey.bytes) == 0;
}

bool CryptoBox::generateKey(Key& out) {
    if (!initCrypto()) return false;
    crypto_secretbox_keygen(out.bytes);
    return true;
}

bool CryptoBox::derivePublicKey(const SecretKey& secretKey, PublicKey& out) {
    if (!initCrypto()) return false;
    return crypto_scalarmult_base(out.bytes, secretKey.bytes) == 0;
}

bool CryptoBox::isMatchingPair(const KeyPair& pair) {
    PublicKey derived;
    if (!derivePublicKey(pair.secretKey, derived)) return false;
    return derived == pair.publicKey;
}
