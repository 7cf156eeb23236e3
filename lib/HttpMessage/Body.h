/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/Body.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Streamed bodies. BodyCollector concatenates a body that arrives in chunks
 * (the async web server body callback shape: data, len, index, total) into
 * one contiguous buffer, with an optional size limit. BodyFiller does the
 * reverse and serves a complete body through a chunked-response filler.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

#include "HttpMessage.h"
#include "Types.h"

class BodyCollector {
public:
    // maxLength == 0 means unlimited.
    explicit BodyCollector(size_t maxLength = 0);

    // One chunk at offset 'index' of a body of 'total' bytes (0 if unknown).
    // Returns the state after the chunk was applied.
    BodyState onChunk(const uint8_t* data, size_t len, size_t index, size_t total);

    // Marks the end of a body whose total was not known up front.
    BodyState finish();

    BodyState state() const { return _state; }
    bool isComplete() const { return _state == BODY_COMPLETE; }
    size_t received() const { return _body.size(); }
    size_t maxLength() const { return _maxLength; }

    const std::string& body() const { return _body; }

    // Moves the collected body into 'msg'. False unless complete.
    bool moveInto(HttpMessage& msg);

    void reset();

private:
    size_t _maxLength;
    size_t _total;
    BodyState _state;
    std::string _body;
};

class BodyFiller {
public:
    explicit BodyFiller(const std::string& body) : _body(body) {}

    // Copies up to maxLen bytes starting at 'index'. Returns 0 at the end.
    size_t fill(uint8_t* buffer, size_t maxLen, size_t index) const;

    size_t length() const { return _body.size(); }

private:
    std::string _body;
};
