/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/Router.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "Router.h"
#include "Types.h"

// =================================================================================
// SECTION: ROUTED REQUEST
// =================================================================================

bool RoutedRequest::route(const std::string& remaining) {
    std::string full = _request.path();
    if (remaining.size() > full.size()) return false;
    if (full.compare(full.size() - remaining.size(), remaining.size(), remaining) != 0) return false;

    _split = full.size() - remaining.size();
    return true;
}

// =================================================================================
// SECTION: ROUTE TABLE
// =================================================================================

void Router::on(const std::string& path, const std::string& method, RouteHandler handler) {
    Route r;
    r.path = path;
    r.method = method;
    r.handler = handler;
    r.child = NULL;
    _routes.push_back(r);
}

void Router::mount(const std::string& prefix, Router& child) {
    Route r;
    r.path = prefix;
    while (r.path.size() > 1 && r.path[r.path.size() - 1] == '/') {
        r.path.erase(r.path.size() - 1);
    }
    r.child = &child;
    _routes.push_back(r);
}

bool Router::matchesPrefix(const std::string& path, const std::string& prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    if (path.size() == prefix.size()) return true;
    // Segment boundary: "/v1" must not match "/v10"
    return prefix == "/" || path[prefix.size()] == '/';
}

// =================================================================================
// SECTION: DISPATCH
// =================================================================================

bool Router::tryDispatch(RoutedRequest& req, HttpResponse& res, int& status) const {
    std::string remaining = req.path();
    std::string current = remaining.empty() ? std::string("/") : remaining;
    bool pathMatched = false;

    for (size_t i = 0; i < _routes.size(); i++) {
        const Route& r = _routes[i];

        if (r.child != NULL) {
            if (!matchesPrefix(remaining, r.path)) continue;

            std::string rest = (r.path == "/") ? remaining : remaining.substr(r.path.size());
            if (!req.route(rest)) continue;

            int childStatus = 404;
            if (r.child->tryDispatch(req, res, childStatus)) {
                status = 200;
                return true;
            }
            if (childStatus == 405) pathMatched = true;

            // Hand the consumed prefix back before trying the next route
            if (!req.route(remaining)) {
                status = 500;
                return false;
            }
            continue;
        }

        if (r.path != current) continue;
        if (!r.method.empty() && r.method != req.inner().method) {
            pathMatched = true;
            continue;
        }

        r.handler(req, res);
        status = 200;
        return true;
    }

    status = pathMatched ? 405 : 404;
    return false;
}

bool Router::dispatch(RoutedRequest& req, HttpResponse& res) const {
    int status = 404;
    if (tryDispatch(req, res, status)) return true;

    res.status = status;
    res.body = HttpResponse::reasonPhrase(status);
    if (!res.setHeader(HEADER_CONTENT_TYPE, "text/plain")) {
        res.headers.remove(HEADER_CONTENT_TYPE);
    }
    return false;
}
