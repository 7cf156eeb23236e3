/*
 * =================================================================================
 * Project:   Illumium API
 * File:      WebAPI.h / WebAPI.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * HTTP endpoint implementation. Defines the JSON endpoints (health, details,
 * public key, client address, logs, echo) and registers them both at the root
 * and under the /v1 prefix.
 * =================================================================================
 */
#ifndef WEBAPI_H
#define WEBAPI_H

#include <string>

#include "ClientInfo.h"
#include "HttpMessage.h"
#include "Router.h"

// =================================================================================
// SECTION: CONNECTION STATE
// =================================================================================

// Transport address of the current request (set by the server loop).
extern IpAddress g_peerAddress;

// =================================================================================
// SECTION: SERVER SETUP
// =================================================================================
void setupWebServer(Router &server);

// Dispatches one request. Unmatched paths and methods get a JSON error body.
void serveRequest(const Router &server, const HttpRequest &request, HttpResponse &response);

// =================================================================================
// SECTION: HELPERS
// =================================================================================
void sendJsonError(HttpResponse &response, int code, const std::string &message);

#endif
