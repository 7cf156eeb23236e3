/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/ClientInfo.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Client address discovery behind reverse proxies (X-Real-IP and
 * X-Forwarded-For), plus a small IPv4/IPv6 address value type.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <string>
#include <vector>

#include "HttpMessage.h"
#include "Types.h"

struct IpAddress {
    IpFamily family;
    uint8_t bytes[16]; // IPv4 uses the first 4 bytes

    IpAddress();

    // Strict textual form (dotted quad or RFC 4291). Surrounding spaces are not accepted.
    static bool parse(const std::string& text, IpAddress& out);

    std::string toString() const;
    bool isValid() const { return family != IP_NONE; }

    bool operator==(const IpAddress& other) const;
    bool operator!=(const IpAddress& other) const { return !(*this == other); }
};

class ClientInfo {
public:
    // Address in X-Real-IP. False if absent or unparsable.
    static bool getXRealIp(const HttpRequest& req, IpAddress& out);

    // Comma separated chain in X-Forwarded-For. Any bad entry fails the whole lookup.
    static bool getXForwardedFor(const HttpRequest& req, std::vector<IpAddress>& out);

    // With trustProxy: X-Real-IP, then the first X-Forwarded-For entry, then 'peer'.
    // Without: always 'peer'.
    static IpAddress resolveClientAddress(const HttpRequest& req, const IpAddress& peer, bool trustProxy);

    static std::string trim(const std::string& s);
};
