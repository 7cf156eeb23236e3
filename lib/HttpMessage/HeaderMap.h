/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/HeaderMap.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Ordered multi-map of HTTP header fields. Names are case-insensitive and
 * stored lower-case. Values are validated on the way in so that anything
 * stored can be written back to the wire unchanged.
 * =================================================================================
 */
#pragma once
#include <string>
#include <utility>
#include <vector>

class HeaderMap {
public:
    typedef std::pair<std::string, std::string> Field;
    typedef std::vector<Field>::const_iterator const_iterator;

    // Adds another value for the name. Returns false on an invalid name/value.
    bool append(const std::string& name, const std::string& value);

    // Replaces every value stored under the name.
    bool set(const std::string& name, const std::string& value);

    // First value stored under the name.
    bool get(const std::string& name, std::string& out) const;
    bool contains(const std::string& name) const;

    // All values stored under the name, in insertion order.
    std::vector<std::string> getAll(const std::string& name) const;

    // Returns the number of removed values.
    size_t remove(const std::string& name);
    void clear() { _fields.clear(); }

    size_t size() const { return _fields.size(); }
    bool empty() const { return _fields.empty(); }
    const_iterator begin() const { return _fields.begin(); }
    const_iterator end() const { return _fields.end(); }

    // --- Validation ---
    // RFC 7230 token.
    static bool isValidName(const std::string& name);
    // Visible ASCII, SP, HTAB and obs-text; no other control bytes.
    static bool isValidValue(const std::string& value);
    // Like isValidValue but without obs-text (safe to treat as text).
    static bool isVisibleAscii(const std::string& value);

    static std::string toLower(const std::string& s);

private:
    std::vector<Field> _fields;
};
