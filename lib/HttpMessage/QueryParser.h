/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/QueryParser.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Query string access. Parses "application/x-www-form-urlencoded" pairs into
 * a JSON object, with bracket keys building nested objects and arrays:
 *
 *   page=2&filter[tag]=red&ids[]=1&ids[]=2
 *   -> {"page":"2","filter":{"tag":"red"},"ids":["1","2"]}
 *
 * Indexed keys are ordered by index and compacted, so "a[1]=y&a[0]=x" and
 * "a[0]=x&a[5]=y" both give ["x","y"]. "[]" entries follow the indexed ones.
 * All leaf values are strings; callers convert as needed.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>
#include <vector>

#include "HttpMessage.h"
#include "Types.h"

struct QueryNode;

class QueryParser {
public:
    // Raw query text after '?'. False if the target has none.
    static bool getQueryStr(const HttpRequest& req, std::string& out);

    // QUERY_ABSENT leaves 'out' untouched. QUERY_INVALID writes errorMsg.
    static QueryResult getQuery(const HttpRequest& req, JsonDocument& out, std::string& errorMsg);

    // Parses a bare query string into 'out' (replacing its content).
    static bool parse(const std::string& query, JsonDocument& out, std::string& errorMsg);

    // '+' becomes space, %XX becomes a byte. False on a malformed escape.
    static bool urlDecode(const std::string& in, std::string& out);

private:
    static bool splitKey(const std::string& key, std::vector<std::string>& path, std::string& errorMsg);
    static bool insert(QueryNode& node, const std::vector<std::string>& path, size_t depth,
                       const std::string& value, std::string& errorMsg);
    static bool isIndex(const std::string& segment);
};
