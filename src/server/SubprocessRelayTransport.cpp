#include "SubprocessRelayTransport.hpp"

#include "BridgeErrors.hpp"
#include "PortMappingTracker.hpp"
#include "ProcessUtils.hpp"
#include "PtyShellChannel.hpp"

namespace tcode {
SubprocessRelayTransport::SubprocessRelayTransport(
    const CodespaceConnectionInfo& _info, const BridgeConfig& _config,
    const string& _loggerId)
    : info(_info),
      config(_config),
      loggerId(_loggerId),
      forwarderPid(-1),
      outputFd(-1),
      disposed(false),
      nextEventId(1),
      forwarderExited(false) {}

SubprocessRelayTransport::~SubprocessRelayTransport() {
  if (!disposed) {
    dispose();
  }
}

void SubprocessRelayTransport::start() {
  map<string, string> values = {
      {"codespace", info.name},
      {"tunnel_id", info.tunnelId},
      {"cluster_id", info.clusterId},
      {"ssh_port", to_string(config.sshRemotePort)},
  };
  auto argv = ProcessUtils::expandCommand(config.forwarderCommand, values);
  try {
    forwarderPid = ProcessUtils::spawnWithOutputPipe(argv, &outputFd);
  } catch (const std::runtime_error& re) {
    throw BridgeError(string("Cannot start tunnel forwarder: ") + re.what());
  }
  CLOG(INFO, loggerId.c_str())
      << "Started tunnel forwarder " << forwarderPid << " for " << info.name;
  emitTrace(TraceLevel::INFO, "Connecting to tunnel " + info.tunnelId);
  readerThread = std::thread(&SubprocessRelayTransport::readLoop, this);
}

shared_ptr<TraceSink> SubprocessRelayTransport::getTraceSink() {
  lock_guard<std::mutex> guard(sinkMutex);
  return traceSink;
}

void SubprocessRelayTransport::setTraceSink(shared_ptr<TraceSink> sink) {
  lock_guard<std::mutex> guard(sinkMutex);
  traceSink = sink;
}

vector<TunnelPort> SubprocessRelayTransport::listPorts() {
  // The forwarder does not expose the tunnel's port records
  return {};
}

optional<uint16_t> SubprocessRelayTransport::waitForForwardedPort(
    uint16_t remotePort, chrono::milliseconds timeout) {
  {
    unique_lock<std::mutex> lock(portMutex);
    bool found = portCondition.wait_for(lock, timeout, [this, remotePort] {
      return remoteToLocal.count(remotePort) > 0 || forwarderExited;
    });
    if (found && remoteToLocal.count(remotePort)) {
      return remoteToLocal[remotePort];
    }
    if (forwarderExited) {
      return nullopt;
    }
  }
  // Forwarders that bind the same port number locally and do not announce it
  if (ProcessUtils::isLocalPortOpen(remotePort)) {
    CLOG(INFO, loggerId.c_str())
        << "Port " << remotePort << " is listening locally, assuming "
        << remotePort << " -> " << remotePort;
    emitTrace(TraceLevel::INFO, "Forwarding from 127.0.0.1:" +
                                    to_string(remotePort) + " to host port " +
                                    to_string(remotePort) + ".");
    return remotePort;
  }
  return nullopt;
}

shared_ptr<SecureShellChannel> SubprocessRelayTransport::openShell(
    const PortMapping& sshMapping, const TerminalSize& size) {
  if (disposed || !isRunning()) {
    throw BridgeError("Tunnel to " + info.name + " is not running");
  }
  vector<string> command = {
      "ssh",
      "-tt",
      "-p",
      to_string(sshMapping.localPort),
      "-o",
      "StrictHostKeyChecking=no",
      "-o",
      "UserKnownHostsFile=/dev/null",
      "-o",
      "LogLevel=ERROR",
      config.sshUser + "@127.0.0.1",
  };
  auto shell = make_shared<PtyShellChannel>(command, size, loggerId);
  shell->start();
  emitTrace(TraceLevel::INFO, "SSH session connected on local port " +
                                  to_string(sshMapping.localPort));
  return shell;
}

shared_ptr<RpcFacility> SubprocessRelayTransport::getRpcFacility() {
  return nullptr;
}

void SubprocessRelayTransport::dispose() {
  if (disposed.exchange(true)) {
    throw ChannelFault("Tunnel to " + info.name + " already disposed");
  }
  CLOG(INFO, loggerId.c_str()) << "Stopping tunnel forwarder for " << info.name;
  ProcessUtils::terminate(forwarderPid, chrono::milliseconds(2000));
  if (readerThread.joinable()) {
    readerThread.join();
  }
  if (outputFd >= 0) {
    ::close(outputFd);
    outputFd = -1;
  }
  emitTrace(TraceLevel::INFO, "Tunnel disconnected");
}

void SubprocessRelayTransport::readLoop() {
  el::Helpers::setThreadName("forwarder-reader");
  string pending;
  char buf[4096];
  while (true) {
    int rc;
    try {
      if (!ProcessUtils::waitForData(outputFd, chrono::milliseconds(100))) {
        if (disposed) {
          break;
        }
        continue;
      }
      rc = ::read(outputFd, buf, sizeof(buf));
    } catch (const std::runtime_error& re) {
      CLOG(ERROR, loggerId.c_str()) << "Forwarder read failed: " << re.what();
      break;
    }
    if (rc < 0 && (GetErrno() == EAGAIN || GetErrno() == EINTR)) {
      continue;
    }
    if (rc <= 0) {
      break;
    }
    pending.append(buf, rc);
    size_t newline;
    while ((newline = pending.find('\n')) != string::npos) {
      string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (!line.empty()) {
        handleLine(line);
      }
    }
  }
  if (!pending.empty()) {
    handleLine(pending);
  }
  {
    lock_guard<std::mutex> guard(portMutex);
    forwarderExited = true;
  }
  portCondition.notify_all();
  if (!disposed) {
    emitTrace(TraceLevel::ERROR, "Tunnel forwarder exited, disconnected");
  }
}

void SubprocessRelayTransport::handleLine(const string& line) {
  CVLOG(1, loggerId.c_str()) << "forwarder: " << line;
  auto mapping = PortMappingTracker::parseForwardingMessage(line);
  if (mapping) {
    {
      lock_guard<std::mutex> guard(portMutex);
      remoteToLocal[mapping->remotePort] = mapping->localPort;
    }
    portCondition.notify_all();
  }
  bool isError = toLower(line).find("error") != string::npos;
  emitTrace(isError ? TraceLevel::ERROR : TraceLevel::INFO, line);
}

void SubprocessRelayTransport::emitTrace(TraceLevel level,
                                         const string& message) {
  lock_guard<std::mutex> guard(sinkMutex);
  if (traceSink) {
    traceSink->trace(level, nextEventId, message);
  }
  nextEventId++;
}

bool SubprocessRelayTransport::isRunning() {
  lock_guard<std::mutex> guard(portMutex);
  return !forwarderExited;
}
}  // namespace tcode
