/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/TypeChain.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Computes the Content-Type a message would carry after one encoding layer is
 * removed (unwrap) or added (wrap). The message itself is not modified.
 * =================================================================================
 */
#pragma once
#include <string>

#include "HttpMessage.h"

class TypeChain {
public:
    // Content-Type ends with '+subtype' (or '/subtype'): out = type without it.
    static bool unwrapType(const HttpMessage& msg, const std::string& subtype, std::string& out);

    // Content-Type present: out = type with 'subtype' appended.
    static bool wrapType(const HttpMessage& msg, const std::string& subtype, std::string& out);
};
