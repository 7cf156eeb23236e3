/*
 * =================================================================================
 * Project:   Illumium API
 * File:      Server.h / Server.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Single-request transport. Reads one HTTP/1.x request from a file
 * descriptor, dispatches it and writes the response to another. The process
 * entry point runs this over stdin/stdout.
 * =================================================================================
 */
#ifndef SERVER_H
#define SERVER_H

#include <stdint.h>
#include <string>

#include "ClientInfo.h"
#include "HttpMessage.h"
#include "Router.h"

// =================================================================================
// SECTION: TRANSPORT
// =================================================================================

/**
 * Reads one request from 'fd'.
 * Returns 200 on success, 0 when there is nothing to answer (no input or a
 * read error), otherwise the error status to answer with (400, 413, 431).
 */
int readRequest(int fd, uint32_t maxBodyLength, HttpRequest &req, std::string &errorMsg);

bool writeAll(int fd, const std::string &data);

// Peer address of 'fd' when it is a connected socket.
bool getSocketPeer(int fd, IpAddress &out);

// =================================================================================
// SECTION: SERVING
// =================================================================================

/**
 * Reads, dispatches and answers one request.
 * Returns the process exit code: 0 once a response is written, 1 otherwise.
 */
int serveConnection(const Router &server, int inFd, int outFd);

void printStartupDiagnostics(const char *settingsPath);

#endif
