/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/HttpMessage.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "HttpMessage.h"
#include "Types.h"

// =================================================================================
// SECTION: HEADER ACCESS
// =================================================================================

bool HttpMessage::isHeader(const std::string& name, const std::string& value) const {
    std::string current;
    if (!headers.get(name, current)) return false;
    return current == value;
}

bool HttpMessage::getHeader(const std::string& name, std::string& out) const {
    return headers.get(name, out);
}

bool HttpMessage::getHeaderStr(const std::string& name, std::string& out) const {
    std::string value;
    if (!headers.get(name, value)) return false;
    if (!HeaderMap::isVisibleAscii(value)) return false;
    out = value;
    return true;
}

bool HttpMessage::getHeaderBin(const std::string& name, std::string& out) const {
    return headers.get(name, out);
}

bool HttpMessage::setHeader(const std::string& name, const std::string& value) {
    return headers.set(name, value);
}

// =================================================================================
// SECTION: REQUEST TARGET
// =================================================================================

std::string HttpRequest::path() const {
    size_t q = target.find('?');
    if (q == std::string::npos) return target;
    return target.substr(0, q);
}

bool HttpRequest::query(std::string& out) const {
    size_t q = target.find('?');
    if (q == std::string::npos) return false;
    out = target.substr(q + 1);
    return true;
}

// =================================================================================
// SECTION: RESPONSE
// =================================================================================

bool HttpResponse::send(int code, const std::string& contentType, const std::string& content) {
    status = code;
    body = content;
    if (contentType.empty()) return true;
    return setHeader(HEADER_CONTENT_TYPE, contentType);
}

const char* HttpResponse::reasonPhrase(int code) {
    switch (code) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 415: return "Unsupported Media Type";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
    }
}
