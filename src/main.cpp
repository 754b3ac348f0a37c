/*
  tank_bridge (host side of the water-tank rig)

  Purpose:
  Bridge the rig's serial link to the HTTP control plane.

  - RX: drain rig telemetry lines, keep the latest reading
  - TX: push PV / CO / lower level to the control plane, log a CSV row
  - Pull the remote setpoint and forward changes to the rig
  - Reconnect to the rig forever; Ctrl-C / SIGTERM shuts down cleanly

  Usage:
    tank_bridge [config.json]
*/

#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include <curl/curl.h>

#include "Params.h"

#include "app/BridgeConfig.h"
#include "app/ControlLoop.h"
#include "comms/AsioSerialPort.h"
#include "comms/SerialLink.h"
#include "remote/CurlHttpClient.h"
#include "remote/RemoteSync.h"
#include "sensors/UnitConverter.h"
#include "storage/AuditLog.h"
#include "utils/Clock.h"
#include "utils/Logger.h"


/*=============================================================================
  SHUTDOWN
=============================================================================*/

static volatile sig_atomic_t g_stop = 0;

static void onSignal(int) {
  g_stop = 1;
}

static void installSignalHandlers() {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static void printUsage(const char* argv0) {
  fprintf(stderr, "usage: %s [config.json]\n", argv0);
}


/*=============================================================================
  RUN
=============================================================================*/

static void runBridge(const BridgeConfig& cfg) {
  AsioSerialPort port;
  SerialLink link(port, cfg.serial, &delayMs);

  CurlHttpClient http;
  RemoteSync remote(http, cfg.http);

  AuditLog audit(cfg.audit_path);
  UnitConverter converter(cfg.calibration());

  ControlLoop loop(link, remote, audit, converter, cfg.timing, cfg.setpoint_default);

  LOG_INFO(LogDomain::SYSTEM, "Rig %s @ %lu baud, push %s, pull %s, audit %s",
           cfg.serial.device.c_str(), (unsigned long)cfg.serial.baud,
           cfg.http.push_url.c_str(), cfg.http.pull_url.c_str(), cfg.audit_path.c_str());

  if (loop.begin(&g_stop)) {
    loop.run(g_stop);
  }

  LOG_INFO(LogDomain::SYSTEM, "Program terminated");
  link.close();

  LOG_INFO(LogDomain::SERIAL, "RX lines=%lu ok=%lu fail=%lu ovf=%lu handshakes=%lu connects=%lu",
           (unsigned long)link.rxLines(), (unsigned long)link.rxOk(),
           (unsigned long)link.rxFail(), (unsigned long)link.rxOverflow(),
           (unsigned long)link.rxHandshakes(), (unsigned long)link.connectAttempts());
  LOG_INFO(LogDomain::HTTP, "push ok=%lu fail=%lu, pull fail=%lu",
           (unsigned long)remote.pushOk(), (unsigned long)remote.pushFail(),
           (unsigned long)remote.pullFail());
  LOG_INFO(LogDomain::AUDIT, "rows=%lu failures=%lu",
           (unsigned long)audit.rowsWritten(), (unsigned long)audit.failures());
}


/*=============================================================================
  MAIN
=============================================================================*/

int main(int argc, char** argv) {
  if (argc > 2) {
    printUsage(argv[0]);
    return 2;
  }

  BridgeConfig cfg;
  std::string error;

  if (argc == 2) {
    if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
      printUsage(argv[0]);
      return 0;
    }
    if (!loadConfigFile(argv[1], cfg, error)) {
      LOG_ERROR(LogDomain::CONFIG, "%s", error.c_str());
      return 1;
    }
  }

  // Degenerate calibration is fatal here, never per sample
  if (!validateConfig(cfg, error)) {
    LOG_ERROR(LogDomain::CONFIG, "Invalid configuration: %s", error.c_str());
    return 1;
  }

  logger_begin(cfg.log_level, isatty(STDERR_FILENO) != 0);

  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    LOG_ERROR(LogDomain::HTTP, "curl_global_init failed: %s", curl_easy_strerror(rc));
    return 1;
  }

  installSignalHandlers();

  runBridge(cfg);

  curl_global_cleanup();
  LOG_INFO(LogDomain::SYSTEM, "Cleanup complete");
  return 0;
}
