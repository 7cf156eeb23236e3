/*
 * File: test/test_sealedbox_codec/test_sealedbox_codec.cpp
 * Description: Unit tests for key generation and sealed-box body encryption.
 */
#include <unity.h>
#include <string>
#include "CryptoKeys.h"
#include "HttpMessage.h"
#include "SealedBoxCodec.h"

#define VENDOR "application/vnd.illumium.v1"

static KeyPair recipient;

// ============================================================================
// KEY TESTS
// ============================================================================

void test_generated_pair_matches(void) {
    TEST_ASSERT_TRUE(CryptoBox::isMatchingPair(recipient));

    PublicKey derived;
    TEST_ASSERT_TRUE(CryptoBox::derivePublicKey(recipient.secretKey, derived));
    TEST_ASSERT_TRUE(derived == recipient.publicKey);
}

void test_generated_pairs_differ(void) {
    KeyPair other;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(other));
    TEST_ASSERT_TRUE(other.publicKey != recipient.publicKey);
    TEST_ASSERT_TRUE(other.secretKey != recipient.secretKey);

    // Mixed halves do not match
    KeyPair mixed;
    mixed.publicKey = other.publicKey;
    mixed.secretKey = recipient.secretKey;
    TEST_ASSERT_FALSE(CryptoBox::isMatchingPair(mixed));
}

void test_generate_symmetric_key(void) {
    Key a, b;
    TEST_ASSERT_TRUE(CryptoBox::generateKey(a));
    TEST_ASSERT_TRUE(CryptoBox::generateKey(b));
    TEST_ASSERT_TRUE(a != b);
    TEST_ASSERT_TRUE(a != Key());
}

void test_from_slice_exact_size(void) {
    uint8_t raw[KEY_BYTES + 1];
    for (size_t i = 0; i < sizeof(raw); i++) raw[i] = (uint8_t)i;

    PublicKey pk;
    TEST_ASSERT_TRUE(PublicKey::fromSlice(raw, KEY_BYTES, pk));
    TEST_ASSERT_EQUAL_HEX8(31, pk.bytes[31]);

    TEST_ASSERT_FALSE(PublicKey::fromSlice(raw, KEY_BYTES + 1, pk));
    TEST_ASSERT_FALSE(PublicKey::fromSlice(raw, KEY_BYTES - 1, pk));
    TEST_ASSERT_FALSE(SecretKey::fromSlice(NULL, KEY_BYTES, recipient.secretKey));
}

// ============================================================================
// RAW HELPER TESTS
// ============================================================================

void test_seal_and_open(void) {
    std::string sealed;
    TEST_ASSERT_TRUE(SealedBoxCodec::sealBytes("secret", recipient.publicKey, sealed));
    TEST_ASSERT_EQUAL(6 + 48, sealed.size());

    std::string plain;
    TEST_ASSERT_TRUE(SealedBoxCodec::openBytes(sealed, recipient.publicKey, recipient.secretKey, plain));
    TEST_ASSERT_EQUAL_STRING("secret", plain.c_str());
}

void test_seal_is_randomized(void) {
    std::string a, b;
    TEST_ASSERT_TRUE(SealedBoxCodec::sealBytes("same", recipient.publicKey, a));
    TEST_ASSERT_TRUE(SealedBoxCodec::sealBytes("same", recipient.publicKey, b));
    TEST_ASSERT_TRUE(a != b);
}

void test_open_with_wrong_key(void) {
    KeyPair other;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(other));

    std::string sealed;
    TEST_ASSERT_TRUE(SealedBoxCodec::sealBytes("secret", recipient.publicKey, sealed));

    std::string plain = "untouched";
    TEST_ASSERT_FALSE(SealedBoxCodec::openBytes(sealed, other.publicKey, other.secretKey, plain));
    TEST_ASSERT_EQUAL_STRING("untouched", plain.c_str());
}

void test_open_tampered_or_short(void) {
    std::string sealed;
    TEST_ASSERT_TRUE(SealedBoxCodec::sealBytes("secret", recipient.publicKey, sealed));
    sealed[sealed.size() - 1] ^= 0x01;

    std::string plain;
    TEST_ASSERT_FALSE(SealedBoxCodec::openBytes(sealed, recipient.publicKey, recipient.secretKey, plain));
    TEST_ASSERT_FALSE(SealedBoxCodec::openBytes("short", recipient.publicKey, recipient.secretKey, plain));
}

// ============================================================================
// BODY TESTS
// ============================================================================

void test_encrypt_decrypt_body(void) {
    HttpRequest req;
    req.body = "{\"a\":1}";

    TEST_ASSERT_EQUAL(CODEC_OK, SealedBoxCodec::encrypt(req, recipient.publicKey));
    TEST_ASSERT_EQUAL(7 + 48, req.body.size());

    TEST_ASSERT_EQUAL(CODEC_OK, SealedBoxCodec::decrypt(req, recipient.publicKey, recipient.secretKey));
    TEST_ASSERT_EQUAL_STRING("{\"a\":1}", req.body.c_str());
}

void test_decrypt_wrong_key_untouched(void) {
    KeyPair other;
    TEST_ASSERT_TRUE(CryptoBox::generateKeyPair(other));

    HttpRequest req;
    req.body = "payload";
    TEST_ASSERT_EQUAL(CODEC_OK, SealedBoxCodec::encrypt(req, recipient.publicKey));
    std::string sealed = req.body;

    TEST_ASSERT_EQUAL(CODEC_INVALID_DATA, SealedBoxCodec::decrypt(req, other.publicKey, other.secretKey));
    TEST_ASSERT_TRUE(req.body == sealed);
}

void test_encrypt_with_type(void) {
    HttpResponse res;
    res.body = "hi";

    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, SealedBoxCodec::encryptWithType(res, recipient.publicKey, ""));
    TEST_ASSERT_EQUAL_STRING("hi", res.body.c_str());

    TEST_ASSERT_EQUAL(CODEC_OK, SealedBoxCodec::encryptWithType(res, recipient.publicKey, VENDOR "+sealedbox"));
    TEST_ASSERT_TRUE(res.isHeader(HEADER_CONTENT_TYPE, VENDOR "+sealedbox"));

    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE,
                      SealedBoxCodec::decryptWithType(res, recipient.publicKey, recipient.secretKey, VENDOR));
    TEST_ASSERT_EQUAL(CODEC_OK, SealedBoxCodec::decryptWithType(res, recipient.publicKey, recipient.secretKey,
                                                                VENDOR "+sealedbox"));
    TEST_ASSERT_EQUAL_STRING("hi", res.body.c_str());
}

void test_auto_type_round_trip(void) {
    HttpRequest req;
    req.setHeader(HEADER_CONTENT_TYPE, VENDOR "+json");
    req.body = "[1,2,3]";

    TEST_ASSERT_EQUAL(CODEC_OK, SealedBoxCodec::encryptAutoType(req, recipient.publicKey));
    TEST_ASSERT_TRUE(req.isHeader(HEADER_CONTENT_TYPE, VENDOR "+json+sealedbox"));

    TEST_ASSERT_EQUAL(CODEC_OK, SealedBoxCodec::decryptAutoType(req, recipient.publicKey, recipient.secretKey));
    TEST_ASSERT_TRUE(req.isHeader(HEADER_CONTENT_TYPE, VENDOR "+json"));
    TEST_ASSERT_EQUAL_STRING("[1,2,3]", req.body.c_str());
}

void test_decrypt_auto_type_checks_type_first(void) {
    HttpRequest req;
    req.setHeader(HEADER_CONTENT_TYPE, VENDOR "+json");
    req.body = "garbage";

    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE,
                      SealedBoxCodec::decryptAutoType(req, recipient.publicKey, recipient.secretKey));

    req.setHeader(HEADER_CONTENT_TYPE, VENDOR "+json+sealedbox");
    TEST_ASSERT_EQUAL(CODEC_INVALID_DATA,
                      SealedBoxCodec::decryptAutoType(req, recipient.publicKey, recipient.secretKey));
    TEST_ASSERT_TRUE(req.isHeader(HEADER_CONTENT_TYPE, VENDOR "+json+sealedbox"));
    TEST_ASSERT_EQUAL_STRING("garbage", req.body.c_str());
}

void test_encrypt_auto_type_requires_content_type(void) {
    HttpResponse res;
    res.body = "hi";
    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, SealedBoxCodec::encryptAutoType(res, recipient.publicKey));
    TEST_ASSERT_EQUAL_STRING("hi", res.body.c_str());
}

// ============================================================================
// MAIN
// ============================================================================

void setUp(void) {}
void tearDown(void) {}

int main(void) {
    if (!CryptoBox::initCrypto()) return 1;
    if (!CryptoBox::generateKeyPair(recipient)) return 1;

    UNITY_BEGIN();

    // Keys
    RUN_TEST(test_generated_pair_matches);
    RUN_TEST(test_generated_pairs_differ);
    RUN_TEST(test_generate_symmetric_key);
    RUN_TEST(test_from_slice_exact_size);

    // Raw Helpers
    RUN_TEST(test_seal_and_open);
    RUN_TEST(test_seal_is_randomized);
    RUN_TEST(test_open_with_wrong_key);
    RUN_TEST(test_open_tampered_or_short);

    // Bodies
    RUN_TEST(test_encrypt_decrypt_body);
    RUN_TEST(test_decrypt_wrong_key_untouched);
    RUN_TEST(test_encrypt_with_type);
    RUN_TEST(test_auto_type_round_trip);
    RUN_TEST(test_decrypt_auto_type_checks_type_first);
    RUN_TEST(test_encrypt_auto_type_requires_content_type);

    return UNITY_END();
}
