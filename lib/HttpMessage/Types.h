/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/Types.h
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

// --- Enums ---
enum CodecError : uint8_t { CODEC_OK, CODEC_INVALID_TYPE, CODEC_INVALID_DATA };
enum QueryResult : uint8_t { QUERY_ABSENT, QUERY_OK, QUERY_INVALID };
enum BodyState : uint8_t { BODY_COLLECTING, BODY_COMPLETE, BODY_TOO_LARGE, BODY_INVALID };
enum IpFamily : uint8_t { IP_NONE, IP_V4, IP_V6 };

// --- Constants ---

// Header names used across the codecs
#define HEADER_CONTENT_TYPE "Content-Type"
#define HEADER_CONTENT_LENGTH "Content-Length"
#define HEADER_X_REAL_IP "X-Real-IP"
#define HEADER_X_FORWARDED_FOR "X-Forwarded-For"

// Subtype tags understood by the body codecs
#define SUBTYPE_JSON "json"
#define SUBTYPE_BASE64 "base64"
#define SUBTYPE_SEALEDBOX "sealedbox"

// Wire limits
#define MAX_HEAD_LENGTH 8192
#define MAX_HEADER_COUNT 64

extern const char *codecErrorToString(CodecError e);
extern const char *bodyStateToString(BodyState s);
