/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/TypeChain.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "TypeChain.h"
#include "ContentType.h"
#include "Types.h"

bool TypeChain::unwrapType(const HttpMessage& msg, const std::string& subtype, std::string& out) {
    std::string mimetype;
    if (!msg.getHeaderStr(HEADER_CONTENT_TYPE, mimetype)) return false;

    ContentType ct(mimetype);
    std::string last;
    if (!ct.lastSubtype(last) || last != subtype) return false;

    ct.popSubtype();
    std::string result = ct.str();
    if (!HeaderMap::isValidValue(result)) return false;

    out = result;
    return true;
}

bool TypeChain::wrapType(const HttpMessage& msg, const std::string& subtype, std::string& out) {
    std::string mimetype;
    if (!msg.getHeaderStr(HEADER_CONTENT_TYPE, mimetype)) return false;

    ContentType ct(mimetype);
    ct.pushSubtype(subtype);
    std::string result = ct.str();
    if (!HeaderMap::isValidValue(result)) return false;

    out = result;
    return true;
}
