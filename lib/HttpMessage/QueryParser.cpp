/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/QueryParser.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <algorithm>
#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>

#include "QueryParser.h"

// Bracket nesting allowed below the top-level key
#define MAX_QUERY_DEPTH 5

// =================================================================================
// SECTION: ACCESS
// =================================================================================

bool QueryParser::getQueryStr(const HttpRequest& req, std::string& out) {
    return req.query(out);
}

QueryResult QueryParser::getQuery(const HttpRequest& req, JsonDocument& out, std::string& errorMsg) {
    std::string query;
    if (!getQueryStr(req, query)) return QUERY_ABSENT;

    if (!parse(query, out, errorMsg)) return QUERY_INVALID;
    return QUERY_OK;
}

// =================================================================================
// SECTION: DECODING
// =================================================================================

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool QueryParser::urlDecode(const std::string& in, std::string& out) {
    std::string result;
    result.reserve(in.size());

    for (size_t i = 0; i < in.size(); i++) {
        char c = in[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%') {
            if (i + 2 >= in.size()) return false;
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi < 0 || lo < 0) return false;
            result += (char)((hi << 4) | lo);
            i += 2;
        } else {
            result += c;
        }
    }

    out = result;
    return true;
}

bool QueryParser::isIndex(const std::string& segment) {
    if (segment.empty() || segment.size() > 6) return false;
    for (size_t i = 0; i < segment.size(); i++) {
        if (!isdigit((unsigned char)segment[i])) return false;
    }
    return true;
}

bool QueryParser::splitKey(const std::string& key, std::vector<std::string>& path, std::string& errorMsg) {
    size_t open = key.find('[');
    std::string base = key.substr(0, open);

    if (base.empty()) {
        errorMsg = "Empty query key.";
        return false;
    }
    if (base.find(']') != std::string::npos) {
        errorMsg = "Unbalanced brackets in query key: " + key;
        return false;
    }
    path.push_back(base);

    size_t pos = open;
    while (pos != std::string::npos && pos < key.size()) {
        if (key[pos] != '[') {
            errorMsg = "Unexpected text after ']' in query key: " + key;
            return false;
        }
        size_t close = key.find(']', pos + 1);
        if (close == std::string::npos) {
            errorMsg = "Unbalanced brackets in query key: " + key;
            return false;
        }
        std::string segment = key.substr(pos + 1, close - pos - 1);
        if (segment.find('[') != std::string::npos) {
            errorMsg = "Unbalanced brackets in query key: " + key;
            return false;
        }
        path.push_back(segment);
        if (path.size() > MAX_QUERY_DEPTH + 1) {
            errorMsg = "Query key nested too deep: " + key;
            return false;
        }
        pos = close + 1;
    }
    return true;
}

// =================================================================================
// SECTION: TREE BUILDING
// =================================================================================

enum QueryNodeKind : uint8_t { QNODE_EMPTY, QNODE_VALUE, QNODE_OBJECT, QNODE_ARRAY };

// Parse tree kept until all pairs are read. Array children carry a sort key:
// "0" + padded index for a[N], "1" + padded sequence for a[].
struct QueryNode {
    QueryNodeKind kind;
    std::string value;
    std::vector<std::string> keys;
    std::vector<QueryNode> children;
    size_t appended;

    QueryNode() : kind(QNODE_EMPTY), appended(0) {}
};

static std::string sortKey(char group, unsigned long n) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%c%010lu", group, n);
    return std::string(buf);
}

static QueryNode* findChild(QueryNode& node, const std::string& key) {
    for (size_t i = 0; i < node.keys.size(); i++) {
        if (node.keys[i] == key) return &node.children[i];
    }
    return NULL;
}

static QueryNode& addChild(QueryNode& node, const std::string& key) {
    node.keys.push_back(key);
    node.children.push_back(QueryNode());
    return node.children.back();
}

bool QueryParser::insert(QueryNode& node, const std::vector<std::string>& path, size_t depth,
                         const std::string& value, std::string& errorMsg) {
    const std::string& segment = path[depth];
    bool last = (depth + 1 == path.size());

    std::string key;
    if (node.kind == QNODE_OBJECT) {
        if (segment.empty()) {
            errorMsg = "Cannot append to non-array query key: " + path[0];
            return false;
        }
        key = segment;
    } else {
        if (!segment.empty() && !isIndex(segment)) {
            errorMsg = "Query key used as both array and object: " + path[0];
            return false;
        }
        key = segment.empty() ? sortKey('1', node.appended++) : sortKey('0', strtoul(segment.c_str(), NULL, 10));
    }

    QueryNode* child = findChild(node, key);
    if (child == NULL) child = &addChild(node, key);

    if (last) {
        if (child->kind == QNODE_OBJECT || child->kind == QNODE_ARRAY) {
            errorMsg = "Query key used as both value and container: " + path[0];
            return false;
        }
        // Repeated scalar keys: last one wins
        child->kind = QNODE_VALUE;
        child->value = value;
        return true;
    }

    if (child->kind == QNODE_EMPTY) {
        bool nextIsArray = path[depth + 1].empty() || isIndex(path[depth + 1]);
        child->kind = nextIsArray ? QNODE_ARRAY : QNODE_OBJECT;
    } else if (child->kind == QNODE_VALUE) {
        errorMsg = "Query key used as both value and container: " + path[0];
        return false;
    }
    return insert(*child, path, depth + 1, value, errorMsg);
}

static void emitArray(const QueryNode& node, JsonArray arr);

static void emitObject(const QueryNode& node, JsonObject obj) {
    for (size_t i = 0; i < node.children.size(); i++) {
        const QueryNode& child = node.children[i];
        const std::string& key = node.keys[i];
        if (child.kind == QNODE_OBJECT) {
            emitObject(child, obj[key].to<JsonObject>());
        } else if (child.kind == QNODE_ARRAY) {
            emitArray(child, obj[key].to<JsonArray>());
        } else {
            obj[key] = child.value;
        }
    }
}

static void emitArray(const QueryNode& node, JsonArray arr) {
    std::vector<size_t> order(node.children.size());
    for (size_t i = 0; i < order.size(); i++) order[i] = i;
    std::sort(order.begin(), order.end(),
              [&node](size_t a, size_t b) { return node.keys[a] < node.keys[b]; });

    for (size_t i = 0; i < order.size(); i++) {
        const QueryNode& child = node.children[order[i]];
        if (child.kind == QNODE_OBJECT) {
            emitObject(child, arr.add<JsonObject>());
        } else if (child.kind == QNODE_ARRAY) {
            emitArray(child, arr.add<JsonArray>());
        } else {
            arr.add(child.value);
        }
    }
}

bool QueryParser::parse(const std::string& query, JsonDocument& out, std::string& errorMsg) {
    QueryNode root;
    root.kind = QNODE_OBJECT;

    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        size_t end = (amp == std::string::npos) ? query.size() : amp;
        std::string pair = query.substr(start, end - start);

        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string rawKey = pair.substr(0, eq);
            std::string rawValue = (eq == std::string::npos) ? std::string() : pair.substr(eq + 1);

            std::string key;
            std::string value;
            if (!urlDecode(rawKey, key) || !urlDecode(rawValue, value)) {
                errorMsg = "Malformed percent-encoding in query.";
                return false;
            }

            std::vector<std::string> path;
            if (!splitKey(key, path, errorMsg)) return false;
            if (!insert(root, path, 0, value, errorMsg)) return false;
        }

        if (amp == std::string::npos) break;
        start = amp + 1;
    }

    JsonDocument doc;
    emitObject(root, doc.to<JsonObject>());
    if (doc.overflowed()) {
        errorMsg = "Query too large.";
        return false;
    }

    out = doc;
    return true;
}
