/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/ClientInfo.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <arpa/inet.h>
#include <ctype.h>
#include <string.h>

#include "ClientInfo.h"

// =================================================================================
// SECTION: IP ADDRESS
// =================================================================================

IpAddress::IpAddress() : family(IP_NONE) {
    memset(bytes, 0, sizeof(bytes));
}

bool IpAddress::parse(const std::string& text, IpAddress& out) {
    if (text.empty() || text.find('\0') != std::string::npos) return false;

    IpAddress addr;
    if (text.find(':') != std::string::npos) {
        if (inet_pton(AF_INET6, text.c_str(), addr.bytes) != 1) return false;
        addr.family = IP_V6;
    } else {
        if (inet_pton(AF_INET, text.c_str(), addr.bytes) != 1) return false;
        addr.family = IP_V4;
    }
    out = addr;
    return true;
}

std::string IpAddress::toString() const {
    char buf[INET6_ADDRSTRLEN];
    const char* res = NULL;

    if (family == IP_V4) {
        res = inet_ntop(AF_INET, bytes, buf, sizeof(buf));
    } else if (family == IP_V6) {
        res = inet_ntop(AF_INET6, bytes, buf, sizeof(buf));
    }
    return res ? std::string(res) : std::string();
}

bool IpAddress::operator==(const IpAddress& other) const {
    if (family != other.family) return false;
    size_t len = (family == IP_V4) ? 4 : (family == IP_V6 ? 16 : 0);
    return memcmp(bytes, other.bytes, len) == 0;
}

// =================================================================================
// SECTION: PROXY HEADERS
// =================================================================================

std::string ClientInfo::trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && isspace((unsigned char)s[start])) start++;
    while (end > start && isspace((unsigned char)s[end - 1])) end--;
    return s.substr(start, end - start);
}

bool ClientInfo::getXRealIp(const HttpRequest& req, IpAddress& out) {
    std::string value;
    if (!req.getHeaderStr(HEADER_X_REAL_IP, value)) return false;
    return IpAddress::parse(value, out);
}

bool ClientInfo::getXForwardedFor(const HttpRequest& req, std::vector<IpAddress>& out) {
    std::string value;
    if (!req.getHeaderStr(HEADER_X_FORWARDED_FOR, value)) return false;

    std::vector<IpAddress> chain;
    size_t start = 0;
    while (true) {
        size_t comma = value.find(',', start);
        std::string part = trim(value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));

        IpAddress addr;
        if (!IpAddress::parse(part, addr)) return false;
        chain.push_back(addr);

        if (comma == std::string::npos) break;
        start = comma + 1;
    }

    out = chain;
    return true;
}

IpAddress ClientInfo::resolveClientAddress(const HttpRequest& req, const IpAddress& peer, bool trustProxy) {
    if (!trustProxy) return peer;

    IpAddress real;
    if (getXRealIp(req, real)) return real;

    std::vector<IpAddress> chain;
    if (getXForwardedFor(req, chain) && !chain.empty()) return chain[0];

    return peer;
}
