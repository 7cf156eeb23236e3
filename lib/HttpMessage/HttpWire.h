/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/HttpWire.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Minimal HTTP/1.x framing: parses a request head (request line + header
 * lines, without the terminating blank line) and serializes a response with
 * an explicit Content-Length. Chunked transfer coding is not supported.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <string>

#include "HttpMessage.h"

class HttpWire {
public:
    // Offset just past the "\r\n\r\n" (or "\n\n") ending the head, or npos.
    static size_t findHeadEnd(const std::string& buffer);

    // Parses 'head' into 'req' (body untouched). contentLength is 0 when absent.
    static bool parseRequestHead(const std::string& head, HttpRequest& req, size_t& contentLength,
                                 std::string& errorMsg);

    // Status line, headers (Content-Length replaced), blank line, body.
    static std::string serializeResponse(const HttpResponse& res);

    // Request in the same framing, used by clients and tests.
    static std::string serializeRequest(const HttpRequest& req);

private:
    static bool parseContentLength(const std::string& value, size_t& out);
};
