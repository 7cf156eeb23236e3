/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/Types.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * String conversions for the shared enums (used in logs and error bodies).
 * =================================================================================
 */
#include "Types.h"

const char *codecErrorToString(CodecError e) {
  switch (e) {
  case CODEC_OK:
    return "ok";
  case CODEC_INVALID_TYPE:
    return "invalid type";
  case CODEC_INVALID_DATA:
    return "invalid data";
  default:
    return "unknown";
  }
}

const char *bodyStateToString(BodyState s) {
  switch (s) {
  case BODY_COLLECTING:
    return "collecting";
  case BODY_COMPLETE:
    return "complete";
  case BODY_TOO_LARGE:
    return "too large";
  case BODY_INVALID:
    return "invalid";
  default:
    return "unknown";
  }
}
