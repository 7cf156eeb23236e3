/*
 * File: test/test_base64_codec/test_base64_codec.cpp
 * Description: Unit tests for Base64Codec body encoding.
 * Verifies the type checks run before data decoding and that failures leave
 * the message untouched.
 */
#include <unity.h>
#include <string>
#include "Base64Codec.h"
#include "HttpMessage.h"

#define VENDOR "application/vnd.illumium.v1"

// ============================================================================
// RAW HELPER TESTS
// ============================================================================

void test_encode_bytes_known_vectors(void) {
    TEST_ASSERT_EQUAL_STRING("", Base64Codec::encodeBytes("").c_str());
    TEST_ASSERT_EQUAL_STRING("Zg==", Base64Codec::encodeBytes("f").c_str());
    TEST_ASSERT_EQUAL_STRING("Zm8=", Base64Codec::encodeBytes("fo").c_str());
    TEST_ASSERT_EQUAL_STRING("Zm9v", Base64Codec::encodeBytes("foo").c_str());
    TEST_ASSERT_EQUAL_STRING("aGVsbG8=", Base64Codec::encodeBytes("hello").c_str());
}

void test_encode_bytes_uses_standard_alphabet(void) {
    const uint8_t raw[] = {0xfb, 0xff, 0xbf};
    TEST_ASSERT_EQUAL_STRING("+/+/", Base64Codec::encodeBytes(raw, sizeof(raw)).c_str());
}

void test_decode_bytes(void) {
    std::string out;
    TEST_ASSERT_TRUE(Base64Codec::decodeBytes("aGVsbG8=", out));
    TEST_ASSERT_EQUAL_STRING("hello", out.c_str());

    TEST_ASSERT_TRUE(Base64Codec::decodeBytes("", out));
    TEST_ASSERT_EQUAL(0, out.size());
}

void test_decode_bytes_rejects_invalid(void) {
    std::string out;
    TEST_ASSERT_FALSE(Base64Codec::decodeBytes("aGVsbG8", out));   // missing padding
    TEST_ASSERT_FALSE(Base64Codec::decodeBytes("aGV$bG8=", out));  // bad character
    TEST_ASSERT_FALSE(Base64Codec::decodeBytes("aGVsbG8=x", out)); // trailing data
    TEST_ASSERT_FALSE(Base64Codec::decodeBytes("-_-_", out));      // url-safe alphabet
}

// ============================================================================
// PLAIN BODY TESTS
// ============================================================================

void test_encode_decode_body(void) {
    HttpRequest req;
    req.body = std::string("\x00\x01\x02\xff", 4);

    TEST_ASSERT_EQUAL(CODEC_OK, Base64Codec::encode(req));
    TEST_ASSERT_EQUAL_STRING("AAEC/w==", req.body.c_str());

    TEST_ASSERT_EQUAL(CODEC_OK, Base64Codec::decode(req));
    TEST_ASSERT_EQUAL(4, req.body.size());
    TEST_ASSERT_EQUAL_HEX8(0xff, (uint8_t)req.body[3]);
}

void test_decode_invalid_body_untouched(void) {
    HttpRequest req;
    req.body = "not base64!";
    TEST_ASSERT_EQUAL(CODEC_INVALID_DATA, Base64Codec::decode(req));
    TEST_ASSERT_EQUAL_STRING("not base64!", req.body.c_str());
}

// ============================================================================
// EXPLICIT TYPE TESTS
// ============================================================================

void test_decode_with_type(void) {
    HttpRequest req;
    req.setHeader(HEADER_CONTENT_TYPE, "text/plain+base64");
    req.body = "aGVsbG8=";

    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, Base64Codec::decodeWithType(req, "text/plain"));
    TEST_ASSERT_EQUAL_STRING("aGVsbG8=", req.body.c_str());

    TEST_ASSERT_EQUAL(CODEC_OK, Base64Codec::decodeWithType(req, "text/plain+base64"));
    TEST_ASSERT_EQUAL_STRING("hello", req.body.c_str());

    // Header is not rewritten by the explicit variant
    TEST_ASSERT_TRUE(req.isHeader(HEADER_CONTENT_TYPE, "text/plain+base64"));
}

void test_encode_with_type(void) {
    HttpResponse res;
    res.body = "hello";

    TEST_ASSERT_EQUAL(CODEC_OK, Base64Codec::encodeWithType(res, "text/plain+base64"));
    TEST_ASSERT_EQUAL_STRING("aGVsbG8=", res.body.c_str());
    TEST_ASSERT_TRUE(res.isHeader(HEADER_CONTENT_TYPE, "text/plain+base64"));
}

void test_encode_with_invalid_type(void) {
    HttpResponse res;
    res.body = "hello";
    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, Base64Codec::encodeWithType(res, "text/plain\r\nX: y"));
    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, Base64Codec::encodeWithType(res, ""));
    TEST_ASSERT_EQUAL_STRING("hello", res.body.c_str());
    TEST_ASSERT_FALSE(res.headers.contains(HEADER_CONTENT_TYPE));
}

// ============================================================================
// AUTOMATIC TYPE TESTS
// ============================================================================

void test_decode_auto_type(void) {
    HttpRequest req;
    req.setHeader(HEADER_CONTENT_TYPE, VENDOR "+json+base64");
    req.body = "eyJhIjoxfQ==";

    TEST_ASSERT_EQUAL(CODEC_OK, Base64Codec::decodeAutoType(req));
    TEST_ASSERT_EQUAL_STRING("{\"a\":1}", req.body.c_str());
    TEST_ASSERT_TRUE(req.isHeader(HEADER_CONTENT_TYPE, VENDOR "+json"));
}

void test_decode_auto_type_checks_type_first(void) {
    HttpRequest req;
    req.setHeader(HEADER_CONTENT_TYPE, VENDOR "+json");
    req.body = "%%% definitely not base64 %%%";

    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, Base64Codec::decodeAutoType(req));

    HttpRequest untyped;
    untyped.body = "aGVsbG8=";
    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, Base64Codec::decodeAutoType(untyped));
}

void test_decode_auto_type_bad_data_untouched(void) {
    HttpRequest req;
    req.setHeader(HEADER_CONTENT_TYPE, VENDOR "+json+base64");
    req.body = "eyJhIjoxfQ";

    TEST_ASSERT_EQUAL(CODEC_INVALID_DATA, Base64Codec::decodeAutoType(req));
    TEST_ASSERT_EQUAL_STRING("eyJhIjoxfQ", req.body.c_str());
    TEST_ASSERT_TRUE(req.isHeader(HEADER_CONTENT_TYPE, VENDOR "+json+base64"));
}

void test_encode_auto_type(void) {
    HttpResponse res;
    res.setHeader(HEADER_CONTENT_TYPE, VENDOR "+json");
    res.body = "{\"a\":1}";

    TEST_ASSERT_EQUAL(CODEC_OK, Base64Codec::encodeAutoType(res));
    TEST_ASSERT_EQUAL_STRING("eyJhIjoxfQ==", res.body.c_str());
    TEST_ASSERT_TRUE(res.isHeader(HEADER_CONTENT_TYPE, VENDOR "+json+base64"));
}

void test_encode_auto_type_requires_content_type(void) {
    HttpResponse res;
    res.body = "hello";
    TEST_ASSERT_EQUAL(CODEC_INVALID_TYPE, Base64Codec::encodeAutoType(res));
    TEST_ASSERT_EQUAL_STRING("hello", res.body.c_str());
}

void test_error_names(void) {
    TEST_ASSERT_EQUAL_STRING("ok", codecErrorToString(CODEC_OK));
    TEST_ASSERT_EQUAL_STRING("invalid type", codecErrorToString(CODEC_INVALID_TYPE));
    TEST_ASSERT_EQUAL_STRING("invalid data", codecErrorToString(CODEC_INVALID_DATA));
}

// ============================================================================
// MAIN
// ============================================================================

void setUp(void) {}
void tearDown(void) {}

int main(void) {
    UNITY_BEGIN();

    // Raw Helpers
    RUN_TEST(test_encode_bytes_known_vectors);
    RUN_TEST(test_encode_bytes_uses_standard_alphabet);
    RUN_TEST(test_decode_bytes);
    RUN_TEST(test_decode_bytes_rejects_invalid);

    // Plain Body
    RUN_TEST(test_encode_decode_body);
    RUN_TEST(test_decode_invalid_body_untouched);

    // Explicit Type
    RUN_TEST(test_decode_with_type);
    RUN_TEST(test_encode_with_type);
    RUN_TEST(test_encode_with_invalid_type);

    // Automatic Type
    RUN_TEST(test_decode_auto_type);
    RUN_TEST(test_decode_auto_type_checks_type_first);
    RUN_TEST(test_decode_auto_type_bad_data_untouched);
    RUN_TEST(test_encode_auto_type);
    RUN_TEST(test_encode_auto_type_requires_content_type);
    RUN_TEST(test_error_names);

    return UNITY_END();
}
