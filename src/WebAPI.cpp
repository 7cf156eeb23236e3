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
#include <ArduinoJson.h>
#include <chrono>
#include <memory>
#include <stdio.h>
#include <vector>

#include "CodecChain.h"
#include "Globals.h"
#include "JsonCodec.h"
#include "KeyJson.h"
#include "Logger.h"
#include "QueryParser.h"
#include "WebAPI.h"

IpAddress g_peerAddress;

// Versioned mount point, owned here like the server itself is owned by main
static Router v1Server;

// =================================================================================
// SECTION: HELPER FUNCTIONS
// =================================================================================

/**
 * Helper function to send a standardized JSON error response.
 */
void sendJsonError(HttpResponse &response, int code, const std::string &message) {
  // RAII: Automatically freed on scope exit
  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "error";
  (*doc)["message"] = message;
  std::string body;
  serializeJson(*doc, body);
  response.send(code, ILLUMIUM_JSON_TYPE, body);
}

static void sendJson(HttpResponse &response, int code, const JsonDocument &doc) {
  std::string body;
  serializeJson(doc, body);
  response.send(code, ILLUMIUM_JSON_TYPE, body);
}

/**
 * Copies the settings out under a short lock so handlers never hold the
 * mutex while encoding.
 */
static bool snapshotSettings(ApiSettings &out) {
  if (!stateMutex.try_lock_for(std::chrono::milliseconds(1000)))
    return false;
  out = g_apiSettings;
  stateMutex.unlock();
  return true;
}

// =================================================================================
// SECTION: CORE SYSTEM HANDLERS (Root, Health, Details)
// =================================================================================

/**
 * Handler for GET /
 * Returns an HTML list of all API endpoints.
 */
void handleRoot(RoutedRequest &request, HttpResponse &response) {
  std::string html = "<html><head><title>" + std::string(ILLUMIUM_API_NAME) + "</title></head><body>";
  html += "<h1>" + std::string(ILLUMIUM_API_NAME) + " API</h1>";
  html += "<h2>" + std::string(ILLUMIUM_API_VERSION) + "</h2>";
  html += "<p>All endpoints are also served under <b>/v1</b>.</p>";
  html += "<ul>";
  html += "<li><b>GET /health</b> - Simple connectivity check.</li>";
  html += "<li><b>GET /details</b> - API configuration.</li>";
  html += "<li><b>GET /public-key</b> - Sealed-box recipient key.</li>";
  html += "<li><b>GET /client</b> - Client address as seen by the API.</li>";
  html += "<li><b>GET /log</b> - Internal system logs.</li>";
  html += "<li><b>POST /echo</b> - Decode a typed body and send it back.</li>";
  html += "</ul></body></html>";
  response.send(200, ILLUMIUM_HTML_TYPE, html);
}

/**
 * Handler for GET /health
 */
void handleHealth(RoutedRequest &request, HttpResponse &response) {
  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "ok";
  (*doc)["message"] = "API is reachable.";
  sendJson(response, 200, *doc);
}

/**
 * Handler for GET /details
 * Static configuration, polled once by clients.
 */
void handleDetails(RoutedRequest &request, HttpResponse &response) {
  ApiSettings settings;
  if (!snapshotSettings(settings)) {
    sendJsonError(response, 503, "System Busy");
    return;
  }

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["name"] = ILLUMIUM_API_NAME;
  (*doc)["version"] = ILLUMIUM_API_VERSION;
  (*doc)["vendorType"] = settings.vendorType;
  (*doc)["maxBodyLength"] = settings.maxBodyLength;
  (*doc)["trustProxyHeaders"] = settings.trustProxyHeaders;
  (*doc)["publicKey"] = settings.keys.publicKey;

  JsonArray codecs = (*doc)["codecs"].to<JsonArray>();
  codecs.add(SUBTYPE_JSON);
  codecs.add(SUBTYPE_SEALEDBOX);
  codecs.add(SUBTYPE_BASE64);

  sendJson(response, 200, *doc);
}

/**
 * Handler for GET /public-key
 * Typed with the vendor media type so clients can decode it generically.
 */
void handlePublicKey(RoutedRequest &request, HttpResponse &response) {
  ApiSettings settings;
  if (!snapshotSettings(settings)) {
    sendJsonError(response, 503, "System Busy");
    return;
  }

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["publicKey"] = settings.keys.publicKey;

  response.status = 200;
  if (!response.setHeader(HEADER_CONTENT_TYPE, settings.vendorType) ||
      JsonCodec::encodeAutoType(response, *doc) != CODEC_OK) {
    sendJsonError(response, 500, "Could not encode response.");
  }
}

// =================================================================================
// SECTION: DIAGNOSTIC HANDLERS (Client, Log)
// =================================================================================

/**
 * Handler for GET /client
 * Shows which address the API attributes the request to and why.
 */
void handleClient(RoutedRequest &request, HttpResponse &response) {
  ApiSettings settings;
  if (!snapshotSettings(settings)) {
    sendJsonError(response, 503, "System Busy");
    return;
  }
  const HttpRequest &req = request.inner();

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  if (g_peerAddress.isValid())
    (*doc)["peer"] = g_peerAddress.toString();
  else
    (*doc)["peer"] = nullptr;

  IpAddress realIp;
  if (ClientInfo::getXRealIp(req, realIp))
    (*doc)["realIp"] = realIp.toString();
  else
    (*doc)["realIp"] = nullptr;

  std::vector<IpAddress> chain;
  if (ClientInfo::getXForwardedFor(req, chain)) {
    JsonArray arr = (*doc)["forwardedFor"].to<JsonArray>();
    for (size_t i = 0; i < chain.size(); i++) {
      arr.add(chain[i].toString());
    }
  } else {
    (*doc)["forwardedFor"] = nullptr;
  }

  IpAddress resolved = ClientInfo::resolveClientAddress(req, g_peerAddress, settings.trustProxyHeaders);
  if (resolved.isValid())
    (*doc)["address"] = resolved.toString();
  else
    (*doc)["address"] = nullptr;
  (*doc)["trustProxyHeaders"] = settings.trustProxyHeaders;

  sendJson(response, 200, *doc);
}

/**
 * Handler for GET /log
 */
void handleLog(RoutedRequest &request, HttpResponse &response) {
  std::vector<std::string> lines;
  getLogLines(lines);

  std::string text;
  for (size_t i = 0; i < lines.size(); i++) {
    text += lines[i];
    text += "\r\n";
  }
  response.send(200, ILLUMIUM_TEXT_TYPE, text);
}

// =================================================================================
// SECTION: CODEC HANDLERS (Echo)
// =================================================================================

/**
 * Reads the response wrapping from the query:
 *   wrap[]=sealedbox&wrap[]=base64&sealTo=<base64 public key>
 * A single "wrap=base64" is accepted too.
 */
static bool parseWrapOptions(JsonVariantConst query, std::vector<std::string> &layers, PublicKey &sealTo,
                             bool &hasSealTo, std::string &errorMsg) {
  layers.clear();
  hasSealTo = false;

  JsonVariantConst wrap = query["wrap"];
  if (wrap.is<const char *>()) {
    layers.push_back(wrap.as<const char *>());
  } else if (wrap.is<JsonArrayConst>()) {
    for (JsonVariantConst v : wrap.as<JsonArrayConst>()) {
      if (!v.is<const char *>()) {
        errorMsg = "wrap entries must be strings.";
        return false;
      }
      layers.push_back(v.as<const char *>());
    }
  } else if (!wrap.isNull()) {
    errorMsg = "wrap must be a string or a list.";
    return false;
  }

  JsonVariantConst key = query["sealTo"];
  if (!key.isNull()) {
    std::string keyErr;
    if (!KeyJson::read(key, sealTo, keyErr)) {
      errorMsg = "sealTo: " + keyErr;
      return false;
    }
    hasSealTo = true;
  }
  return true;
}

/**
 * Handler for POST /echo
 * Decodes the typed body through its whole subtype chain and sends the value
 * back as a vendor JSON document, optionally wrapped again.
 */
void handleEcho(RoutedRequest &request, HttpResponse &response) {
  ApiSettings settings;
  if (!snapshotSettings(settings)) {
    sendJsonError(response, 503, "System Busy");
    return;
  }
  const HttpRequest &req = request.inner();

  // Size Safety - the server loop enforces this too, but handlers may be called directly
  if (req.body.size() > settings.maxBodyLength) {
    sendJsonError(response, 413, "Payload too large.");
    return;
  }

  // --- 1. QUERY ---
  std::unique_ptr<JsonDocument> query(new JsonDocument());
  std::string errorMsg;
  if (QueryParser::getQuery(req, *query, errorMsg) == QUERY_INVALID) {
    sendJsonError(response, 400, "Invalid query: " + errorMsg);
    return;
  }

  std::vector<std::string> layers;
  PublicKey sealTo;
  bool hasSealTo = false;
  if (!parseWrapOptions(query->as<JsonVariantConst>(), layers, sealTo, hasSealTo, errorMsg)) {
    sendJsonError(response, 400, errorMsg);
    return;
  }

  // --- 2. BODY ---
  HttpMessage body;
  body.headers = req.headers;
  body.body = req.body;

  std::unique_ptr<JsonDocument> value(new JsonDocument());
  CodecError err = CodecChain::decode(body, &settings.keys, *value, errorMsg);
  if (err != CODEC_OK) {
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "/echo decode failed (%s): %s", codecErrorToString(err), errorMsg.c_str());
    logKeyValue("WebAPI", logBuf);
    sendJsonError(response, err == CODEC_INVALID_TYPE ? 415 : 400, errorMsg);
    return;
  }

  // Plain application/json unwraps to "application"
  std::string innerType;
  body.getHeaderStr(HEADER_CONTENT_TYPE, innerType);
  if (innerType != settings.vendorType && innerType != "application") {
    sendJsonError(response, 415, "Unexpected media type: " + innerType);
    return;
  }

  // --- 3. RESPONSE ---
  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "ok";
  (*doc)["echo"] = value->as<JsonVariantConst>();
  if (query->isNull())
    (*doc)["query"].to<JsonObject>();
  else
    (*doc)["query"] = query->as<JsonVariantConst>();

  response.status = 200;
  if (!response.setHeader(HEADER_CONTENT_TYPE, settings.vendorType)) {
    sendJsonError(response, 500, "Invalid vendor type.");
    return;
  }

  err = CodecChain::encode(response, *doc, layers, hasSealTo ? &sealTo : NULL, errorMsg);
  if (err != CODEC_OK) {
    sendJsonError(response, 400, errorMsg);
    return;
  }

  logKeyValue("WebAPI", "/echo");
}

// =================================================================================
// SECTION: SERVER SETUP
// =================================================================================

static void registerRoutes(Router &server) {
  // Root endpoint, list the API.
  server.on("/", "GET", handleRoot);

  // API: Lightweight health check
  server.on("/health", "GET", handleHealth);

  // Get the API details (static data, polled once).
  server.on("/details", "GET", handleDetails);

  // Sealed-box recipient key
  server.on("/public-key", "GET", handlePublicKey);

  // Client address diagnostics
  server.on("/client", "GET", handleClient);

  // Get the in-memory log buffer
  server.on("/log", "GET", handleLog);

  // Decode and echo a typed body
  server.on("/echo", "POST", handleEcho);
}

/**
 * Sets up all API endpoints.
 * This function is just a clean list of routes.
 */
void setupWebServer(Router &server) {
  registerRoutes(server);

  if (v1Server.routeCount() == 0)
    registerRoutes(v1Server);
  server.mount("/v1", v1Server);

  logKeyValue("WebAPI", "Routes registered.");
}

void serveRequest(const Router &server, const HttpRequest &request, HttpResponse &response) {
  RoutedRequest routed(request);
  int status = 200;

  if (!server.tryDispatch(routed, response, status)) {
    sendJsonError(response, status, HttpResponse::reasonPhrase(status));

    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "%d %s %s", status, request.method.c_str(), request.path().c_str());
    logKeyValue("WebAPI", logBuf);
  }
}
