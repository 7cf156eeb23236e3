/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/HeaderMap.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <ctype.h>
#include <string.h>

#include "HeaderMap.h"

// =================================================================================
// SECTION: VALIDATION
// =================================================================================

std::string HeaderMap::toLower(const std::string& s) {
    std::string out(s);
    for (size_t i = 0; i < out.size(); i++) {
        out[i] = (char)tolower((unsigned char)out[i]);
    }
    return out;
}

bool HeaderMap::isValidName(const std::string& name) {
    if (name.empty()) return false;

    static const char* TCHAR_EXTRA = "!#$%&'*+-.^_`|~";
    for (size_t i = 0; i < name.size(); i++) {
        unsigned char c = (unsigned char)name[i];
        if (isalnum(c)) continue;
        if (c != 0 && strchr(TCHAR_EXTRA, c) != NULL) continue;
        return false;
    }
    return true;
}

bool HeaderMap::isValidValue(const std::string& value) {
    for (size_t i = 0; i < value.size(); i++) {
        unsigned char c = (unsigned char)value[i];
        if (c == '\t') continue;
        if (c < 0x20 || c == 0x7F) return false;
    }
    return true;
}

bool HeaderMap::isVisibleAscii(const std::string& value) {
    for (size_t i = 0; i < value.size(); i++) {
        unsigned char c = (unsigned char)value[i];
        if (c == '\t') continue;
        if (c < 0x20 || c >= 0x7F) return false;
    }
    return true;
}

// =================================================================================
// SECTION: ACCESS
// =================================================================================

bool HeaderMap::append(const std::string& name, const std::string& value) {
    if (!isValidName(name) || !isValidValue(value)) return false;
    _fields.push_back(Field(toLower(name), value));
    return true;
}

bool HeaderMap::set(const std::string& name, const std::string& value) {
    if (!isValidName(name) || !isValidValue(value)) return false;

    std::string key = toLower(name);

    // Keep the position of the first occurrence, drop the rest
    bool replaced = false;
    std::vector<Field>::iterator it = _fields.begin();
    while (it != _fields.end()) {
        if (it->first == key) {
            if (!replaced) {
                it->second = value;
                replaced = true;
                ++it;
            } else {
                it = _fields.erase(it);
            }
        } else {
            ++it;
        }
    }

    if (!replaced) {
        _fields.push_back(Field(key, value));
    }
    return true;
}

bool HeaderMap::get(const std::string& name, std::string& out) const {
    std::string key = toLower(name);
    for (const_iterator it = _fields.begin(); it != _fields.end(); ++it) {
        if (it->first == key) {
            out = it->second;
            return true;
        }
    }
    return false;
}

bool HeaderMap::contains(const std::string& name) const {
    std::string ignored;
    return get(name, ignored);
}

std::vector<std::string> HeaderMap::getAll(const std::string& name) const {
    std::vector<std::string> values;
    std::string key = toLower(name);
    for (const_iterator it = _fields.begin(); it != _fields.end(); ++it) {
        if (it->first == key) values.push_back(it->second);
    }
    return values;
}

size_t HeaderMap::remove(const std::string& name) {
    std::string key = toLower(name);
    size_t removed = 0;
    std::vector<Field>::iterator it = _fields.begin();
    while (it != _fields.end()) {
        if (it->first == key) {
            it = _fields.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}
