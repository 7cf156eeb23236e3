/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/ContentType.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Media type with a chain of subtypes: "type/sub1+sub2+sub3".
 * The last subtype names the outermost encoding of the body, so codecs
 * peel subtypes off the end (popSubtype) and add them there (pushSubtype).
 *
 * Examples:
 *   "application/json"              -> type "application", subtypes [json]
 *   "application/json+sbox+base64"  -> subtypes [json, sbox, base64]
 *   "application-json"              -> type "application-json", no subtypes
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

class ContentType {
public:
    explicit ContentType(const std::string& src);

    // Main type (text before the first '/').
    std::string getType() const;

    size_t numSubtypes() const { return _offsets.size() - 1; }

    // Returns false if index is out of range.
    bool getSubtype(size_t index, std::string& out) const;
    bool lastSubtype(std::string& out) const;

    std::vector<std::string> subtypes() const;

    // Hides the last subtype. No-op when there are no subtypes.
    void popSubtype();

    // Appends "/subtype" (first subtype) or "+subtype".
    void pushSubtype(const std::string& subtype);

    // Visible media type string.
    std::string str() const { return _full.substr(0, _offsets.back()); }

    bool operator==(const ContentType& other) const { return str() == other.str(); }
    bool operator!=(const ContentType& other) const { return !(*this == other); }

private:
    std::string _full;
    // _offsets[0] ends the main type, _offsets[i + 1] ends subtype i.
    std::vector<size_t> _offsets;
};
