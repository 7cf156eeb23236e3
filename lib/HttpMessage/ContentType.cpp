/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/ContentType.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "ContentType.h"

ContentType::ContentType(const std::string& src) : _full(src) {
    size_t typeEnd = _full.find('/');
    if (typeEnd == std::string::npos) {
        _offsets.push_back(_full.size());
        return;
    }

    _offsets.push_back(typeEnd);
    size_t off = typeEnd + 1;
    while (true) {
        size_t plus = _full.find('+', off);
        if (plus == std::string::npos) {
            _offsets.push_back(_full.size());
            break;
        }
        _offsets.push_back(plus);
        off = plus + 1;
    }
}

std::string ContentType::getType() const {
    return _full.substr(0, _offsets[0]);
}

bool ContentType::getSubtype(size_t index, std::string& out) const {
    if (index >= numSubtypes()) return false;
    size_t start = _offsets[index] + 1;
    out = _full.substr(start, _offsets[index + 1] - start);
    return true;
}

bool ContentType::lastSubtype(std::string& out) const {
    if (numSubtypes() == 0) return false;
    return getSubtype(numSubtypes() - 1, out);
}

std::vector<std::string> ContentType::subtypes() const {
    std::vector<std::string> list;
    std::string sub;
    for (size_t i = 0; i < numSubtypes(); i++) {
        if (getSubtype(i, sub)) list.push_back(sub);
    }
    return list;
}

void ContentType::popSubtype() {
    if (numSubtypes() > 0) {
        _offsets.pop_back();
    }
}

void ContentType::pushSubtype(const std::string& subtype) {
    // Drop text hidden by earlier pops before growing the visible part
    _full.resize(_offsets.back());

    _full.push_back(numSubtypes() > 0 ? '+' : '/');
    _full += subtype;
    _offsets.push_back(_full.size());
}
