/*
 * =================================================================================
 * Project:   Illumium API
 * File:      main.cpp
 * Description: Application entry point. Serves one HTTP request per process
 *              over stdin/stdout (inetd style).
 *
 * Usage:     illumium-api [settings.json] [--peer ADDRESS]
 * =================================================================================
 */

#include <stdio.h>
#include <string.h>
#include <string>
#include <unistd.h>

// --- Module Includes ---
#include "Config.h"
#include "Globals.h"
#include "Logger.h"
#include "Server.h"
#include "SettingsManager.h"
#include "WebAPI.h"

// --- HTTP Toolkit Includes ---
#include "Router.h"

// --- Main server ---
static Router server;

static void drainLogs() {
  // processLogQueue() moves at most LOG_DRAIN_LINES per call
  for (int i = 0; i <= SERIAL_QUEUE_SIZE / LOG_DRAIN_LINES; i++) {
    processLogQueue();
  }
}

// =================================================================
// --- Core Application ---
// =================================================================

int main(int argc, char **argv) {
  const char *settingsPath = ILLUMIUM_DEFAULT_SETTINGS_PATH;
  const char *peerText = NULL;

  // 1. Arguments
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--peer") == 0 && i + 1 < argc) {
      peerText = argv[++i];
    } else if (argv[i][0] != '-') {
      settingsPath = argv[i];
    } else {
      fprintf(stderr, "usage: %s [settings.json] [--peer ADDRESS]\n", argv[0]);
      return 1;
    }
  }

  // 2. Crypto
  if (!CryptoBox::initCrypto()) {
    logKeyValue("System", "libsodium initialization failed.");
    drainLogs();
    return 1;
  }

  // 3. Settings
  ApiSettings loaded;
  bool changed = false;
  std::string errorMsg;
  if (!SettingsManager::loadSettings(settingsPath, loaded, changed, errorMsg)) {
    logKeyValue("Settings", errorMsg.c_str());
    drainLogs();
    return 1;
  }
  if (changed && !SettingsManager::saveSettings(settingsPath, loaded, errorMsg)) {
    logKeyValue("Settings", errorMsg.c_str());
    drainLogs();
    return 1;
  }
  {
    std::lock_guard<std::recursive_timed_mutex> lock(stateMutex);
    g_apiSettings = loaded;
  }

  // 4. Peer
  if (peerText != NULL) {
    if (!IpAddress::parse(peerText, g_peerAddress)) {
      logKeyValue("System", "Ignoring unparsable --peer address.");
    }
  } else if (!getSocketPeer(STDIN_FILENO, g_peerAddress)) {
    logKeyValue("System", "stdin is not a socket. Peer address unknown.");
  }

  printStartupDiagnostics(settingsPath);
  drainLogs();

  // 5. Routes
  setupWebServer(server);

  // 6. One request
  int exitCode = serveConnection(server, STDIN_FILENO, STDOUT_FILENO);
  drainLogs();
  return exitCode;
}
