/*
 * =================================================================================
 * Project:   Illumium API
 * File:      Server.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Config.h"
#include "Globals.h"
#include "Logger.h"
#include "Server.h"
#include "WebAPI.h"

#include "Body.h"
#include "HttpWire.h"

// =================================================================================
// SECTION: TRANSPORT
// =================================================================================

bool getSocketPeer(int fd, IpAddress &out) {
  struct sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  if (getpeername(fd, (struct sockaddr *)&addr, &len) != 0)
    return false;

  char text[INET6_ADDRSTRLEN] = {0};
  if (addr.ss_family == AF_INET) {
    inet_ntop(AF_INET, &((struct sockaddr_in *)&addr)->sin_addr, text, sizeof(text));
  } else if (addr.ss_family == AF_INET6) {
    inet_ntop(AF_INET6, &((struct sockaddr_in6 *)&addr)->sin6_addr, text, sizeof(text));
  } else {
    return false;
  }
  return IpAddress::parse(text, out);
}

bool writeAll(int fd, const std::string &data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n <= 0)
      return false;
    written += (size_t)n;
  }
  return true;
}

int readRequest(int fd, uint32_t maxBodyLength, HttpRequest &req, std::string &errorMsg) {
  char buf[ILLUMIUM_READ_CHUNK];
  std::string data;
  size_t headEnd = std::string::npos;

  // 1. Head
  while (headEnd == std::string::npos) {
    if (data.size() > MAX_HEAD_LENGTH) {
      errorMsg = "Request head too large.";
      return 431;
    }
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      errorMsg = std::string("Read error: ") + strerror(errno);
      return 0;
    }
    if (n == 0) {
      errorMsg = data.empty() ? "No request received." : "Connection closed inside the request head.";
      return data.empty() ? 0 : 400;
    }
    data.append(buf, (size_t)n);
    headEnd = HttpWire::findHeadEnd(data);
  }

  // A whole oversized head can arrive in the same read as its terminator
  if (headEnd > MAX_HEAD_LENGTH) {
    errorMsg = "Request head too large.";
    return 431;
  }

  size_t contentLength = 0;
  if (!HttpWire::parseRequestHead(data.substr(0, headEnd), req, contentLength, errorMsg))
    return 400;

  if (contentLength == 0)
    return 200;

  // 2. Body
  BodyCollector collector(maxBodyLength);
  std::string leftover = data.substr(headEnd);
  if (leftover.size() > contentLength)
    leftover.resize(contentLength);

  BodyState state = collector.onChunk((const uint8_t *)leftover.data(), leftover.size(), 0, contentLength);
  while (state == BODY_COLLECTING) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n <= 0) {
      errorMsg = "Connection closed inside the request body.";
      return 400;
    }
    size_t len = (size_t)n;
    size_t remaining = contentLength - collector.received();
    if (len > remaining)
      len = remaining;
    state = collector.onChunk((const uint8_t *)buf, len, collector.received(), contentLength);
  }

  if (state == BODY_TOO_LARGE) {
    errorMsg = "Payload too large.";
    return 413;
  }
  if (!collector.moveInto(req)) {
    errorMsg = std::string("Body ") + bodyStateToString(state) + ".";
    return 400;
  }
  return 200;
}

// =================================================================================
// SECTION: SERVING
// =================================================================================

int serveConnection(const Router &server, int inFd, int outFd) {
  uint32_t maxBodyLength;
  {
    std::lock_guard<std::recursive_timed_mutex> lock(stateMutex);
    maxBodyLength = g_apiSettings.maxBodyLength;
  }

  HttpRequest request;
  HttpResponse response;
  std::string errorMsg;
  int status = readRequest(inFd, maxBodyLength, request, errorMsg);
  if (status == 0) {
    logKeyValue("System", errorMsg.c_str());
    return 1;
  }

  if (status == 200) {
    serveRequest(server, request, response);
  } else {
    logKeyValue("System", errorMsg.c_str());
    sendJsonError(response, status, errorMsg);
  }

  char logBuf[MAX_LOG_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "%s %s -> %d", request.method.c_str(), request.target.c_str(), response.status);
  logKeyValue("HTTP", logBuf);

  if (!writeAll(outFd, HttpWire::serializeResponse(response))) {
    logKeyValue("System", "Failed to write the response.");
    return 1;
  }
  return 0;
}

/**
 * Prints high-level build and configuration information.
 */
void printStartupDiagnostics(const char *settingsPath) {
  char logBuf[MAX_LOG_LENGTH];
  ApiSettings settings;
  {
    std::lock_guard<std::recursive_timed_mutex> lock(stateMutex);
    settings = g_apiSettings;
  }

  logMessage(LOG_SEP_MAJOR);
  logMessage("[ VERSION INFO ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "API Name", ILLUMIUM_API_NAME);
  logMessage(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "API Version", ILLUMIUM_API_VERSION);
  logMessage(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", (long)__cplusplus);
  logMessage(logBuf);

  logMessage(LOG_SEP_MINOR);
  logMessage("[ CONFIGURATION ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Settings File", settingsPath);
  logMessage(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Vendor Type", settings.vendorType.c_str());
  logMessage(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Max Body", settings.maxBodyLength);
  logMessage(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Trust Proxy Headers", settings.trustProxyHeaders ? "yes" : "no");
  logMessage(logBuf);
  logMessage(LOG_SEP_MAJOR);
}
