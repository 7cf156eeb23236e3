/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/HttpMessage.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Request and Response value types. Both share the header block and a byte
 * body (std::string used as a byte buffer). The header helpers follow the
 * "first value wins" rule of the header map.
 * =================================================================================
 */
#pragma once
#include <string>

#include "HeaderMap.h"

class HttpMessage {
public:
    HeaderMap headers;
    std::string body;

    virtual ~HttpMessage() {}

    // --- Read Header ---

    // True only if the header exists and its first value equals 'value' exactly.
    bool isHeader(const std::string& name, const std::string& value) const;

    // Raw first value.
    bool getHeader(const std::string& name, std::string& out) const;

    // First value, only if it is plain visible ASCII text.
    bool getHeaderStr(const std::string& name, std::string& out) const;

    // First value as raw bytes (obs-text included).
    bool getHeaderBin(const std::string& name, std::string& out) const;

    // --- Write Header ---

    // Replaces the header. Returns false if name or value is not valid.
    bool setHeader(const std::string& name, const std::string& value);
};

class HttpRequest : public HttpMessage {
public:
    HttpRequest() : method("GET"), target("/") {}
    HttpRequest(const std::string& m, const std::string& t) : method(m), target(t) {}

    std::string method;
    std::string target; // origin-form: path [ "?" query ]

    // Path component of the target (without the query).
    std::string path() const;

    // Query component. Returns false if the target has no '?'.
    bool query(std::string& out) const;
};

class HttpResponse : public HttpMessage {
public:
    HttpResponse() : status(200) {}
    explicit HttpResponse(int code) : status(code) {}

    int status;

    // Sets status, Content-Type and body in one step.
    // Returns false if the content type is not a valid header value.
    bool send(int code, const std::string& contentType, const std::string& content);

    static const char* reasonPhrase(int code);
};
