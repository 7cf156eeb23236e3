/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/HttpWire.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <ctype.h>
#include <stdio.h>
#include <vector>

#include "ClientInfo.h"
#include "HttpWire.h"
#include "Types.h"

// =================================================================================
// SECTION: PARSING
// =================================================================================

size_t HttpWire::findHeadEnd(const std::string& buffer) {
    size_t crlf = buffer.find("\r\n\r\n");
    size_t lf = buffer.find("\n\n");

    if (crlf == std::string::npos && lf == std::string::npos) return std::string::npos;
    if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) return crlf + 4;
    return lf + 2;
}

bool HttpWire::parseContentLength(const std::string& value, size_t& out) {
    if (value.empty() || value.size() > 12) return false;

    size_t n = 0;
    for (size_t i = 0; i < value.size(); i++) {
        if (!isdigit((unsigned char)value[i])) return false;
        n = n * 10 + (size_t)(value[i] - '0');
    }
    out = n;
    return true;
}

bool HttpWire::parseRequestHead(const std::string& head, HttpRequest& req, size_t& contentLength,
                                std::string& errorMsg) {
    if (head.size() > MAX_HEAD_LENGTH) {
        errorMsg = "Request head too large.";
        return false;
    }

    // 1. Split into lines (tolerate bare LF)
    std::string text = head;
    size_t headEnd = findHeadEnd(text);
    if (headEnd != std::string::npos) text.erase(headEnd);

    size_t pos = 0;
    bool first = true;
    HttpRequest parsed;
    size_t length = 0;
    int headerCount = 0;

    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = (nl == std::string::npos) ? text.size() : nl;
        std::string line = text.substr(pos, end - pos);
        if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);
        pos = (nl == std::string::npos) ? text.size() : nl + 1;

        if (line.empty()) {
            if (first) {
                errorMsg = "Missing request line.";
                return false;
            }
            break;
        }

        // 2. Request line
        if (first) {
            size_t sp1 = line.find(' ');
            size_t sp2 = (sp1 == std::string::npos) ? std::string::npos : line.find(' ', sp1 + 1);
            if (sp1 == std::string::npos || sp2 == std::string::npos || line.find(' ', sp2 + 1) != std::string::npos) {
                errorMsg = "Malformed request line.";
                return false;
            }
            parsed.method = line.substr(0, sp1);
            parsed.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
            std::string version = line.substr(sp2 + 1);

            if (!HeaderMap::isValidName(parsed.method)) {
                errorMsg = "Invalid method.";
                return false;
            }
            if (parsed.target.empty() || parsed.target[0] != '/') {
                errorMsg = "Request target must be in origin-form.";
                return false;
            }
            if (version != "HTTP/1.1" && version != "HTTP/1.0") {
                errorMsg = "Unsupported HTTP version: " + version;
                return false;
            }
            first = false;
            continue;
        }

        // 3. Header lines
        if (++headerCount > MAX_HEADER_COUNT) {
            errorMsg = "Too many header fields.";
            return false;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            errorMsg = "Malformed header line.";
            return false;
        }
        std::string name = line.substr(0, colon);
        std::string value = ClientInfo::trim(line.substr(colon + 1));

        if (!parsed.headers.append(name, value)) {
            errorMsg = "Invalid header field: " + name;
            return false;
        }
    }

    if (first) {
        errorMsg = "Missing request line.";
        return false;
    }

    // 4. Framing
    std::string te;
    if (parsed.headers.get("Transfer-Encoding", te)) {
        errorMsg = "Transfer-Encoding is not supported.";
        return false;
    }

    std::vector<std::string> lengths = parsed.headers.getAll(HEADER_CONTENT_LENGTH);
    if (lengths.size() > 1) {
        errorMsg = "Duplicate Content-Length.";
        return false;
    }
    if (lengths.size() == 1 && !parseContentLength(lengths[0], length)) {
        errorMsg = "Invalid Content-Length.";
        return false;
    }

    req.method = parsed.method;
    req.target = parsed.target;
    req.headers = parsed.headers;
    contentLength = length;
    return true;
}

// =================================================================================
// SECTION: SERIALIZATION
// =================================================================================

std::string HttpWire::serializeResponse(const HttpResponse& res) {
    char statusLine[64];
    snprintf(statusLine, sizeof(statusLine), "HTTP/1.1 %d %s\r\n", res.status, HttpResponse::reasonPhrase(res.status));

    std::string out = statusLine;
    for (HeaderMap::const_iterator it = res.headers.begin(); it != res.headers.end(); ++it) {
        if (it->first == "content-length") continue;
        out += it->first + ": " + it->second + "\r\n";
    }
    out += "content-length: " + std::to_string(res.body.size()) + "\r\n";
    out += "\r\n";
    out += res.body;
    return out;
}

std::string HttpWire::serializeRequest(const HttpRequest& req) {
    std::string out = req.method + " " + req.target + " HTTP/1.1\r\n";
    for (HeaderMap::const_iterator it = req.headers.begin(); it != req.headers.end(); ++it) {
        if (it->first == "content-length") continue;
        out += it->first + ": " + it->second + "\r\n";
    }
    if (!req.body.empty()) {
        out += "content-length: " + std::to_string(req.body.size()) + "\r\n";
    }
    out += "\r\n";
    out += req.body;
    return out;
}
