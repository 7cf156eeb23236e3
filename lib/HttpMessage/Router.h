/*
 * =================================================================================
 * Project:   Illumium API - HTTP Message Toolkit
 * File:      lib/HttpMessage/Router.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Path routing. A RoutedRequest remembers how much of the request path has
 * already been consumed by outer routers, so nested routers only ever look
 * at the remainder:
 *
 *   "/v1/echo"  --mount("/v1")-->  prefix "/v1", path "/echo"
 * =================================================================================
 */
#pragma once
#include <functional>
#include <string>
#include <vector>

#include "HttpMessage.h"

class RoutedRequest {
public:
    explicit RoutedRequest(const HttpRequest& request) : _request(request), _split(0) {}

    const HttpRequest& inner() const { return _request; }
    HttpRequest& inner() { return _request; }

    // Makes 'remaining' the unconsumed path. It must be a suffix of the full path.
    bool route(const std::string& remaining);

    // Consumed part of the path.
    std::string prefix() const { return _request.path().substr(0, _split); }

    // Unconsumed part of the path.
    std::string path() const { return _request.path().substr(_split); }

private:
    HttpRequest _request;
    size_t _split;
};

typedef std::function<void(RoutedRequest&, HttpResponse&)> RouteHandler;

class Router {
public:
    // Exact match on the remaining path. An empty method matches any method.
    void on(const std::string& path, const std::string& method, RouteHandler handler);

    // Nests 'child' under a path prefix ("/v1" matches "/v1" and "/v1/...").
    // The child is held by reference and must outlive this router.
    void mount(const std::string& prefix, Router& child);

    // Runs the first matching route. Writes 404 or 405 and returns false otherwise.
    bool dispatch(RoutedRequest& req, HttpResponse& res) const;

    // Same lookup, without writing the fallback response.
    // status is 200 on a match, else 404 or 405. 500 if a failed mount cannot
    // hand its consumed prefix back to req.
    bool tryDispatch(RoutedRequest& req, HttpResponse& res, int& status) const;

    size_t routeCount() const { return _routes.size(); }

private:
    struct Route {
        std::string path;
        std::string method;
        RouteHandler handler;
        Router* child;
    };

    std::vector<Route> _routes;

    static bool matchesPrefix(const std::string& path, const std::string& prefix);
};
