#include "BridgeConfig.hpp"

#include "SimpleIni.h"

namespace tcode {
namespace {
bool parseBool(const string& value) {
  string lower = toLower(value);
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}
}  // namespace

void BridgeConfig::applyIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  const char* bindIpPtr = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIpPtr) {
    bindIp = string(bindIpPtr);
  }
  port = int(ini.GetLongValue("Networking", "port", port));
  workerThreads =
      int(ini.GetLongValue("Networking", "worker_threads", workerThreads));

  gracePeriod = chrono::milliseconds(ini.GetLongValue(
      "Bridge", "grace_period_ms", long(gracePeriod.count())));
  maxTraceHistory = size_t(
      ini.GetLongValue("Bridge", "max_trace_history", long(maxTraceHistory)));
  sshRemotePort = uint16_t(
      ini.GetLongValue("Bridge", "ssh_remote_port", long(sshRemotePort)));
  const char* sshUserPtr = ini.GetValue("Bridge", "ssh_user", NULL);
  if (sshUserPtr) {
    sshUser = string(sshUserPtr);
  }
  portWaitTimeout = chrono::milliseconds(ini.GetLongValue(
      "Bridge", "port_wait_timeout_ms", long(portWaitTimeout.count())));
  const char* forwarder = ini.GetValue("Bridge", "forwarder_command", NULL);
  if (forwarder) {
    forwarderCommand = string(forwarder);
  }

  const char* apiHost = ini.GetValue("GitHub", "api_host", NULL);
  if (apiHost) {
    githubApiHost = string(apiHost);
  }

  debugTrace = ini.GetBoolValue("Debug", "trace", debugTrace);
  verbose = int(ini.GetLongValue("Debug", "verbose", verbose));
  const char* logDir = ini.GetValue("Debug", "log_directory", NULL);
  if (logDir) {
    logDirectory = string(logDir);
  }
  // read log file size limit
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    maxLogSize = string(logsize);
  }
}

void BridgeConfig::applyEnvironment() {
  const char* debugTraceEnv = ::getenv("DEBUG_TRACE");
  if (debugTraceEnv) {
    debugTrace = parseBool(debugTraceEnv);
  }
  const char* keepalive = ::getenv("RPC_SESSION_KEEPALIVE");
  if (keepalive) {
    try {
      gracePeriod = chrono::milliseconds(stol(keepalive));
    } catch (const std::logic_error& le) {
      LOG(WARNING) << "Ignoring invalid RPC_SESSION_KEEPALIVE '" << keepalive
                   << "': " << le.what();
    }
  }
  const char* portEnv = ::getenv("PORT");
  if (portEnv) {
    try {
      port = stoi(portEnv);
    } catch (const std::logic_error& le) {
      LOG(WARNING) << "Ignoring invalid PORT '" << portEnv
                   << "': " << le.what();
    }
  }
}
}  // namespace tcode
