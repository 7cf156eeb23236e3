/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/Body.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <string.h>

#include "Body.h"

// =================================================================================
// SECTION: COLLECTOR (concat)
// =================================================================================

BodyCollector::BodyCollector(size_t maxLength)
    : _maxLength(maxLength), _total(0), _state(BODY_COLLECTING) {}

void BodyCollector::reset() {
    _total = 0;
    _state = BODY_COLLECTING;
    _body.clear();
}

BodyState BodyCollector::onChunk(const uint8_t* data, size_t len, size_t index, size_t total) {
    if (_state != BODY_COLLECTING) return _state;

    // Reject on the declared size before buffering anything
    if (_maxLength > 0 && total > _maxLength) {
        _state = BODY_TOO_LARGE;
        return _state;
    }

    // Chunks must arrive in order and agree on the total
    if (index != _body.size() || (_total != 0 && total != _total) || (len > 0 && data == NULL)) {
        _state = BODY_INVALID;
        return _state;
    }
    _total = total;

    if (_maxLength > 0 && _body.size() + len > _maxLength) {
        _state = BODY_TOO_LARGE;
        return _state;
    }
    if (total != 0 && index + len > total) {
        _state = BODY_INVALID;
        return _state;
    }

    _body.append((const char*)data, len);

    if (total != 0 && index + len == total) {
        _state = BODY_COMPLETE;
    }
    return _state;
}

BodyState BodyCollector::finish() {
    if (_state != BODY_COLLECTING) return _state;

    if (_total != 0 && _body.size() != _total) {
        _state = BODY_INVALID;
    } else {
        _state = BODY_COMPLETE;
    }
    return _state;
}

bool BodyCollector::moveInto(HttpMessage& msg) {
    if (_state != BODY_COMPLETE) return false;
    msg.body.swap(_body);
    _body.clear();
    return true;
}

// =================================================================================
// SECTION: FILLER (rollup)
// =================================================================================

size_t BodyFiller::fill(uint8_t* buffer, size_t maxLen, size_t index) const {
    if (buffer == NULL || index >= _body.size()) return 0;

    size_t n = _body.size() - index;
    if (n > maxLen) n = maxLen;
    memcpy(buffer, _body.data() + index, n);
    return n;
}
