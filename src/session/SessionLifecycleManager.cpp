#include "SessionLifecycleManager.hpp"

#include "BridgeErrors.hpp"
#include "LogHandler.hpp"
#include "PortInfoConverter.hpp"

namespace tcode {
SessionLifecycleManager::SessionLifecycleManager(
    const string& _connectionId, shared_ptr<CodespaceBackend> _backend,
    shared_ptr<SessionEventListener> _listener, const BridgeConfig& _config,
    const string& _loggerId)
    : connectionId(_connectionId),
      backend(_backend),
      listener(_listener),
      config(_config),
      loggerId(_loggerId) {
  tracker = make_shared<PortMappingTracker>(
      config.maxTraceHistory, config.debugTrace, TRACKER_LOGGER);
  session.connectionId = connectionId;
}

SessionLifecycleManager::~SessionLifecycleManager() {
  // A pending timer returned here is destroyed right away, which disposes
  // the RPC facility without waiting for the grace period.
  close();
}

void SessionLifecycleManager::authenticate(const string& token) {
  lock_guard<std::mutex> guard(stateMutex);
  if (session.state == SessionState::CLOSED ||
      session.state == SessionState::DRAINING) {
    throw AuthError("Session is closed");
  }
  if (session.directory) {
    throw AuthError("Already authenticated");
  }
  session.directory = backend->createDirectory(token);
  if (session.state == SessionState::UNAUTHENTICATED) {
    session.state = SessionState::AUTHENTICATED;
  }
  CLOG(INFO, loggerId.c_str()) << "[" << connectionId << "] authenticated";
}

vector<CodespaceSummary> SessionLifecycleManager::listCodespaces() {
  auto directory = requireDirectory();
  auto codespaces = directory->listCodespaces();
  CVLOG(1, loggerId.c_str()) << "[" << connectionId << "] listed "
                             << codespaces.size() << " codespaces";
  return codespaces;
}

void SessionLifecycleManager::connectCodespace(const string& codespaceName) {
  BridgeHandles handles;
  {
    lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
    handles = bridgeTo(codespaceName);
  }
  // Outside the lifecycle lock: a shell that is already gone reports at once
  watchShell(handles.shell, handles.outputEnabled);
}

void SessionLifecycleManager::handleShellClosed(
    shared_ptr<SecureShellChannel> shell, const string& reason) {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  string codespaceName;
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (!shell || session.shell != shell) {
      return;
    }
    codespaceName = session.codespaceName;
  }
  CLOG(WARNING, loggerId.c_str())
      << "[" << connectionId << "] shell for " << codespaceName
      << " ended: " << reason;
  teardownBridge();
  listener->onError("Terminal session closed.");
  listener->onCodespaceState(codespaceName, CODESPACE_STATE_SHUTDOWN, nullopt,
                             nullopt);
}

SessionLifecycleManager::BridgeHandles SessionLifecycleManager::bridgeTo(
    const string& codespaceName) {
  auto directory = requireDirectory();

  if (isBridged()) {
    CLOG(INFO, loggerId.c_str())
        << "[" << connectionId << "] replacing bridge to "
        << getCodespaceName() << " with " << codespaceName;
    teardownBridge();
  }

  {
    lock_guard<std::mutex> guard(stateMutex);
    session.state = SessionState::BRIDGING;
    session.codespaceName = codespaceName;
  }
  CLOG(INFO, loggerId.c_str())
      << "[" << connectionId << "] connecting to " << codespaceName;

  BridgeHandles handles;
  CodespaceConnectionInfo info;
  PortInformation snapshot;
  try {
    info = resolveCodespace(directory, codespaceName);

    handles.transport = backend->openTransport(info);
    if (!handles.transport) {
      throw BridgeError("Relay transport for " + codespaceName +
                        " could not be opened");
    }
    tracker->attachToClient(handles.transport);

    listener->onCodespaceState(codespaceName, CODESPACE_STATE_STARTING,
                               string("Establishing SSH connection via tunnel"),
                               nullopt);

    PortMapping sshMapping = locateSshPort(handles.transport);
    TerminalSize size;
    {
      lock_guard<std::mutex> guard(stateMutex);
      size = session.terminalSize;
    }
    handles.shell = handles.transport->openShell(sshMapping, size);
    if (!handles.shell) {
      throw BridgeError("Shell for " + codespaceName + " could not be opened");
    }
    handles.outputEnabled = make_shared<atomic<bool>>(true);
    auto outputEnabled = handles.outputEnabled;
    auto outputListener = listener;
    handles.shell->setDataCallback(
        [outputEnabled, outputListener](const string& data) {
          if (*outputEnabled) {
            outputListener->onTerminalOutput(data);
          }
        });

    handles.rpcFacility = handles.transport->getRpcFacility();
    snapshot = takePortSnapshot(handles.transport);
  } catch (const DirectoryError& de) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] cannot connect to " << codespaceName
        << ": " << de.what();
    rollbackBridge(&handles);
    reportConnectFailure(codespaceName, de.getCodespaceState());
    throw;
  } catch (const BridgeError& be) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] bridge to " << codespaceName
        << " failed: " << be.what();
    rollbackBridge(&handles);
    reportConnectFailure(codespaceName, "");
    throw;
  } catch (const std::exception& e) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] bridge to " << codespaceName
        << " failed: " << e.what();
    rollbackBridge(&handles);
    reportConnectFailure(codespaceName, "");
    throw BridgeError(e.what());
  }

  {
    lock_guard<std::mutex> guard(stateMutex);
    session.transport = handles.transport;
    session.shell = handles.shell;
    session.rpcFacility = handles.rpcFacility;
    session.outputEnabled = handles.outputEnabled;
    session.portSnapshot = snapshot;
    session.state = SessionState::BRIDGED;
  }
  CLOG(INFO, loggerId.c_str())
      << "[" << connectionId << "] bridged to " << codespaceName;

  listener->onCodespaceState(
      codespaceName, CODESPACE_STATE_CONNECTED,
      string("tunnel -> ") + codespaceName,
      info.codespace);
  listener->onPortUpdate(snapshot);
  return handles;
}

void SessionLifecycleManager::watchShell(
    shared_ptr<SecureShellChannel> shell,
    shared_ptr<atomic<bool>> outputEnabled) {
  weak_ptr<SecureShellChannel> weakShell = shell;
  auto scheduler = taskScheduler;
  shell->setCloseCallback(
      [this, weakShell, outputEnabled, scheduler](const string& reason) {
        auto closedShell = weakShell.lock();
        // Cleared once the bridge is torn down from this side
        if (!closedShell || !*outputEnabled) {
          return;
        }
        auto task = [this, closedShell, reason]() {
          handleShellClosed(closedShell, reason);
        };
        if (scheduler) {
          scheduler(task);
        } else {
          task();
        }
      });
}

bool SessionLifecycleManager::disconnectCodespace() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  requireDirectory();
  if (!isBridged()) {
    CVLOG(1, loggerId.c_str())
        << "[" << connectionId << "] disconnect without a bridge";
    return false;
  }
  string codespaceName = getCodespaceName();
  listener->onCodespaceState(codespaceName, CODESPACE_STATE_SHUTDOWN, nullopt,
                             nullopt);
  teardownBridge();
  CLOG(INFO, loggerId.c_str())
      << "[" << connectionId << "] disconnected from " << codespaceName;
  return true;
}

void SessionLifecycleManager::sendInput(const string& data) {
  shared_ptr<SecureShellChannel> shell;
  {
    lock_guard<std::mutex> guard(stateMutex);
    shell = session.shell;
  }
  if (!shell) {
    CVLOG(1, loggerId.c_str())
        << "[" << connectionId << "] dropping input, no bridge";
    return;
  }
  try {
    shell->write(data);
  } catch (const ChannelFault& cf) {
    // The bridge is being torn down concurrently.
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] input dropped: " << cf.what();
  }
}

void SessionLifecycleManager::resize(const TerminalSize& size) {
  shared_ptr<SecureShellChannel> shell;
  {
    lock_guard<std::mutex> guard(stateMutex);
    session.terminalSize = size;
    shell = session.shell;
  }
  if (!shell) {
    return;
  }
  try {
    shell->resize(size);
  } catch (const ChannelFault& cf) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] resize dropped: " << cf.what();
  }
}

PortInformation SessionLifecycleManager::getPortInfo() {
  requireDirectory();
  lock_guard<std::mutex> guard(stateMutex);
  if (session.portSnapshot) {
    return *session.portSnapshot;
  }
  PortInformation empty;
  empty.timestamp = toIsoTimestamp(chrono::system_clock::now());
  return empty;
}

PortInformation SessionLifecycleManager::refreshPorts() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  requireDirectory();
  shared_ptr<RelayTransport> transport;
  {
    lock_guard<std::mutex> guard(stateMutex);
    transport = session.transport;
  }
  if (!transport) {
    return getPortInfo();
  }
  PortInformation snapshot;
  try {
    snapshot = takePortSnapshot(transport);
  } catch (const std::exception& e) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] port refresh failed: " << e.what();
    {
      lock_guard<std::mutex> guard(stateMutex);
      if (session.portSnapshot) {
        snapshot = *session.portSnapshot;
      }
    }
    snapshot.error = string(e.what());
  }
  {
    lock_guard<std::mutex> guard(stateMutex);
    session.portSnapshot = snapshot;
  }
  listener->onPortUpdate(snapshot);
  return snapshot;
}

shared_ptr<GraceTimer> SessionLifecycleManager::close() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (session.state == SessionState::CLOSED) {
      return nullptr;
    }
    session.state = SessionState::DRAINING;
  }
  BridgeHandles handles = detachHandles();

  closeShell(handles.shell);

  shared_ptr<GraceTimer> graceTimer;
  if (handles.rpcFacility) {
    auto rpcFacility = handles.rpcFacility;
    rpcFacility->markAsDisconnected();
    string timerLoggerId = loggerId;
    string timerConnectionId = connectionId;
    graceTimer = make_shared<GraceTimer>(
        config.gracePeriod, [rpcFacility, timerLoggerId, timerConnectionId]() {
          if (!rpcFacility->isDisconnected()) {
            CLOG(INFO, timerLoggerId.c_str())
                << "[" << timerConnectionId
                << "] RPC facility was picked up again, keeping it";
            return;
          }
          CLOG(INFO, timerLoggerId.c_str())
              << "[" << timerConnectionId
              << "] grace period over, disposing RPC facility";
          try {
            rpcFacility->dispose();
          } catch (const ChannelFault& cf) {
            CLOG(WARNING, timerLoggerId.c_str())
                << "[" << timerConnectionId
                << "] RPC facility already gone: " << cf.what();
          }
        });
    CLOG(INFO, loggerId.c_str())
        << "[" << connectionId << "] keeping RPC facility for "
        << config.gracePeriod.count() << "ms";
  }

  if (handles.transport) {
    tracker->detachFromClient(handles.transport);
  }
  tracker->detachFromAllClients();
  disposeTransport(handles.transport);

  tracker->clearTraces();
  {
    lock_guard<std::mutex> guard(stateMutex);
    session.portState.clear();
    session.portSnapshot.reset();
    session.codespaceName.clear();
    session.directory.reset();
    session.state = SessionState::CLOSED;
  }
  CLOG(INFO, loggerId.c_str()) << "[" << connectionId << "] closed";
  return graceTimer;
}

SessionState SessionLifecycleManager::getState() {
  lock_guard<std::mutex> guard(stateMutex);
  return session.state;
}

string SessionLifecycleManager::getCodespaceName() {
  lock_guard<std::mutex> guard(stateMutex);
  return session.codespaceName;
}

bool SessionLifecycleManager::isAuthenticated() {
  lock_guard<std::mutex> guard(stateMutex);
  return session.directory != nullptr;
}

bool SessionLifecycleManager::isBridged() {
  lock_guard<std::mutex> guard(stateMutex);
  return session.transport != nullptr;
}

shared_ptr<CodespaceDirectory> SessionLifecycleManager::requireDirectory() {
  lock_guard<std::mutex> guard(stateMutex);
  if (!session.directory) {
    throw AuthError(
        "Not authenticated. Please send an authenticate message first.");
  }
  return session.directory;
}

void SessionLifecycleManager::setState(SessionState newState) {
  lock_guard<std::mutex> guard(stateMutex);
  session.state = newState;
}

CodespaceConnectionInfo SessionLifecycleManager::resolveCodespace(
    shared_ptr<CodespaceDirectory> directory, const string& codespaceName) {
  CodespaceConnectionInfo info;
  try {
    info = directory->getConnectionInfo(codespaceName);
  } catch (const DirectoryError&) {
    throw;
  } catch (const std::exception& e) {
    throw DirectoryError(e.what());
  }
  if (!info.state.empty() && info.state != CODESPACE_STATE_AVAILABLE) {
    if (info.state == CODESPACE_STATE_STARTING ||
        info.state == CODESPACE_STATE_PROVISIONING) {
      throw DirectoryError("Codespace is " + info.state +
                               ". This is normal during initialization - "
                               "please retry in 30-60 seconds.",
                           true, info.state);
    }
    throw DirectoryError("Codespace is not available. Current state: " +
                             info.state + ". Please start the codespace first.",
                         false, info.state);
  }
  return info;
}

PortMapping SessionLifecycleManager::locateSshPort(
    shared_ptr<RelayTransport> transport) {
  auto localPort =
      transport->waitForForwardedPort(config.sshRemotePort,
                                      config.portWaitTimeout);
  vector<PortMapping> traced = tracker->extractPortMappingsFromTraces();

  lock_guard<std::mutex> guard(stateMutex);
  session.portState.merge(traced);
  if (localPort) {
    PortMapping waited;
    waited.localPort = *localPort;
    waited.remotePort = config.sshRemotePort;
    waited.provenance = PortProvenance::WAIT_FOR_FORWARDED;
    session.portState.merge({waited});
  }
  auto sshMapping = session.portState.getSshPort();
  if (!sshMapping) {
    throw BridgeError("SSH port " + to_string(config.sshRemotePort) +
                      " was not forwarded within " +
                      to_string(config.portWaitTimeout.count()) + "ms");
  }
  CVLOG(1, loggerId.c_str())
      << "[" << connectionId << "] SSH forwarded on local port "
      << sshMapping->localPort << " ("
      << provenanceToString(sshMapping->provenance) << ")";
  return *sshMapping;
}

PortInformation SessionLifecycleManager::takePortSnapshot(
    shared_ptr<RelayTransport> transport) {
  vector<TunnelPort> records = transport->listPorts();
  vector<PortMapping> queried;
  for (const auto& record : records) {
    for (const auto& uri : record.portForwardingUris) {
      auto localPort = extractLocalPort(uri);
      if (!localPort) {
        continue;
      }
      PortMapping mapping;
      mapping.localPort = *localPort;
      mapping.remotePort = record.portNumber;
      if (!record.protocol.empty()) {
        mapping.protocol = record.protocol;
      }
      mapping.provenance = PortProvenance::TUNNEL_QUERY;
      queried.push_back(mapping);
      break;
    }
  }
  vector<PortMapping> traced = tracker->extractPortMappingsFromTraces();

  lock_guard<std::mutex> guard(stateMutex);
  session.portState.merge(traced);
  session.portState.merge(queried);

  set<uint16_t> reported;
  for (const auto& record : records) {
    reported.insert(record.portNumber);
  }
  for (const auto& mapping : session.portState.allMappings()) {
    if (!mapping.isActive || reported.count(mapping.remotePort)) {
      continue;
    }
    records.push_back(PortInfoConverter::fromMapping(mapping));
    reported.insert(mapping.remotePort);
  }
  return PortInfoConverter::splitPorts(records);
}

SessionLifecycleManager::BridgeHandles
SessionLifecycleManager::detachHandles() {
  lock_guard<std::mutex> guard(stateMutex);
  BridgeHandles handles;
  handles.transport = session.transport;
  handles.shell = session.shell;
  handles.rpcFacility = session.rpcFacility;
  handles.outputEnabled = session.outputEnabled;
  session.transport.reset();
  session.shell.reset();
  session.rpcFacility.reset();
  session.outputEnabled.reset();
  if (handles.outputEnabled) {
    *handles.outputEnabled = false;
  }
  return handles;
}

void SessionLifecycleManager::teardownBridge() {
  setState(SessionState::DRAINING);
  BridgeHandles handles = detachHandles();

  closeShell(handles.shell);
  if (handles.transport) {
    tracker->detachFromClient(handles.transport);
  }
  disposeRpcFacility(handles.rpcFacility);
  disposeTransport(handles.transport);
  // Forwardings learned from this tunnel died with it
  tracker->clearTraces();

  lock_guard<std::mutex> guard(stateMutex);
  session.portState.clear();
  session.portSnapshot.reset();
  session.codespaceName.clear();
  session.state = SessionState::AUTHENTICATED;
}

void SessionLifecycleManager::rollbackBridge(BridgeHandles* handles) {
  if (handles->outputEnabled) {
    *handles->outputEnabled = false;
  }
  disposeRpcFacility(handles->rpcFacility);
  closeShell(handles->shell);
  if (handles->transport) {
    tracker->detachFromClient(handles->transport);
  }
  disposeTransport(handles->transport);
  tracker->clearTraces();
  *handles = BridgeHandles();

  lock_guard<std::mutex> guard(stateMutex);
  session.portState.clear();
  session.portSnapshot.reset();
  session.codespaceName.clear();
  session.state = SessionState::AUTHENTICATED;
}

void SessionLifecycleManager::reportConnectFailure(const string& codespaceName,
                                                   const string& state) {
  listener->onCodespaceState(
      codespaceName, state.empty() ? CODESPACE_STATE_DISCONNECTED : state,
      nullopt, nullopt);
}

void SessionLifecycleManager::closeShell(
    shared_ptr<SecureShellChannel> shell) {
  if (!shell) {
    return;
  }
  try {
    shell->close();
  } catch (const ChannelFault& cf) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] shell already closed: " << cf.what();
  }
}

void SessionLifecycleManager::disposeTransport(
    shared_ptr<RelayTransport> transport) {
  if (!transport) {
    return;
  }
  try {
    transport->dispose();
  } catch (const ChannelFault& cf) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] transport already closed: " << cf.what();
  }
}

void SessionLifecycleManager::disposeRpcFacility(
    shared_ptr<RpcFacility> rpcFacility) {
  if (!rpcFacility) {
    return;
  }
  try {
    rpcFacility->dispose();
  } catch (const ChannelFault& cf) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] RPC facility already closed: "
        << cf.what();
  }
}

optional<uint16_t> SessionLifecycleManager::extractLocalPort(
    const string& uri) {
  size_t hostStart = uri.find("://");
  hostStart = (hostStart == string::npos) ? 0 : hostStart + 3;
  size_t pathStart = uri.find('/', hostStart);
  string authority = uri.substr(hostStart, pathStart == string::npos
                                               ? string::npos
                                               : pathStart - hostStart);
  size_t colon = authority.rfind(':');
  if (colon == string::npos || colon + 1 >= authority.size()) {
    return nullopt;
  }
  string digits = authority.substr(colon + 1);
  if (digits.size() > 5 ||
      !all_of(digits.begin(), digits.end(),
              [](unsigned char c) { return isdigit(c); })) {
    return nullopt;
  }
  int port = stoi(digits);
  if (port < 1 || port > 65535) {
    return nullopt;
  }
  return uint16_t(port);
}
}  // namespace tcode
