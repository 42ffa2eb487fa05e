#ifndef __TCODE_FAKE_CODESPACE_BACKEND__
#define __TCODE_FAKE_CODESPACE_BACKEND__

#include "BridgeErrors.hpp"
#include "ClientChannel.hpp"
#include "CodespaceBackend.hpp"
#include "Headers.hpp"
#include "RelayTransport.hpp"
#include "SessionEventListener.hpp"

namespace tcode {
/**
 * @brief Ordered record of what the fakes were asked to do, shared between
 * them so tests can check teardown order.
 */
class EventLog {
 public:
  void add(const string& event) {
    lock_guard<std::mutex> guard(logMutex);
    events.push_back(event);
  }

  vector<string> getEvents() {
    lock_guard<std::mutex> guard(logMutex);
    return events;
  }

  int count(const string& event) {
    lock_guard<std::mutex> guard(logMutex);
    return int(std::count(events.begin(), events.end(), event));
  }

  /** @brief Position of the first occurrence, -1 if absent. */
  int indexOf(const string& event) {
    lock_guard<std::mutex> guard(logMutex);
    auto it = find(events.begin(), events.end(), event);
    return it == events.end() ? -1 : int(it - events.begin());
  }

  void clear() {
    lock_guard<std::mutex> guard(logMutex);
    events.clear();
  }

 protected:
  std::mutex logMutex;
  vector<string> events;
};

class FakeShellChannel : public SecureShellChannel {
 public:
  FakeShellChannel(const string& _name, shared_ptr<EventLog> _log)
      : name(_name), log(_log), closed(false) {}

  virtual void setDataCallback(std::function<void(const string&)> callback) {
    lock_guard<std::mutex> guard(shellMutex);
    dataCallback = callback;
  }

  virtual void setCloseCallback(
      std::function<void(const string& reason)> callback) {
    lock_guard<std::mutex> guard(shellMutex);
    closeCallback = callback;
  }

  virtual void write(const string& data) {
    lock_guard<std::mutex> guard(shellMutex);
    if (closed) {
      throw ChannelFault("write after close");
    }
    written += data;
  }

  virtual void resize(const TerminalSize& size) {
    lock_guard<std::mutex> guard(shellMutex);
    sizes.push_back(size);
  }

  virtual void close() {
    {
      lock_guard<std::mutex> guard(shellMutex);
      if (closed) {
        throw ChannelFault("shell already closed");
      }
      closed = true;
    }
    log->add(name + ":shell.close");
  }

  /** @brief Simulates output arriving from the remote shell. */
  void emitOutput(const string& data) {
    std::function<void(const string&)> callback;
    {
      lock_guard<std::mutex> guard(shellMutex);
      callback = dataCallback;
    }
    if (callback) {
      callback(data);
    }
  }

  /** @brief Simulates the remote shell exiting. */
  void endRemotely(const string& reason) {
    std::function<void(const string&)> callback;
    {
      lock_guard<std::mutex> guard(shellMutex);
      callback = closeCallback;
      closeCallback = nullptr;
    }
    log->add(name + ":shell.ended");
    if (callback) {
      callback(reason);
    }
  }

  string getWritten() {
    lock_guard<std::mutex> guard(shellMutex);
    return written;
  }

  vector<TerminalSize> getSizes() {
    lock_guard<std::mutex> guard(shellMutex);
    return sizes;
  }

  bool isClosed() {
    lock_guard<std::mutex> guard(shellMutex);
    return closed;
  }

  TerminalSize openedWith;
  PortMapping sshMapping;

 protected:
  string name;
  shared_ptr<EventLog> log;
  std::mutex shellMutex;
  std::function<void(const string&)> dataCallback;
  std::function<void(const string&)> closeCallback;
  string written;
  vector<TerminalSize> sizes;
  bool closed;
};

class FakeRpcFacility : public RpcFacility {
 public:
  FakeRpcFacility(const string& _name, shared_ptr<EventLog> _log)
      : name(_name), log(_log), disconnected(false), disposeCount(0) {}

  virtual void markAsDisconnected() {
    disconnected = true;
    log->add(name + ":rpc.markAsDisconnected");
  }

  virtual bool isDisconnected() { return disconnected; }

  virtual void dispose() {
    disposeCount++;
    log->add(name + ":rpc.dispose");
  }

  /** @brief Simulates a new session picking the facility up again. */
  void reassociate() { disconnected = false; }

  int getDisposeCount() { return disposeCount; }

 protected:
  string name;
  shared_ptr<EventLog> log;
  atomic<bool> disconnected;
  atomic<int> disposeCount;
};

class FakeRelayTransport : public RelayTransport {
 public:
  FakeRelayTransport(const string& _name, shared_ptr<EventLog> _log)
      : name(_name),
        log(_log),
        failShellOpen(false),
        failListPorts(false),
        disposeThrows(false),
        disposeCount(0) {
    traceSink = make_shared<FunctionTraceSink>(
        [](TraceLevel, int, const string&) {});
    rpcFacility = make_shared<FakeRpcFacility>(_name, _log);
    forwardedPorts[CODESPACE_SSH_PORT] = 40022;
  }

  virtual shared_ptr<TraceSink> getTraceSink() {
    lock_guard<std::mutex> guard(transportMutex);
    return traceSink;
  }

  virtual void setTraceSink(shared_ptr<TraceSink> sink) {
    lock_guard<std::mutex> guard(transportMutex);
    traceSink = sink;
  }

  virtual vector<TunnelPort> listPorts() {
    lock_guard<std::mutex> guard(transportMutex);
    if (failListPorts) {
      throw BridgeError("port query timed out");
    }
    return ports;
  }

  virtual optional<uint16_t> waitForForwardedPort(uint16_t remotePort,
                                                  chrono::milliseconds) {
    for (const auto& message : tracesOnWait) {
      emitTrace(TraceLevel::INFO, 0, message);
    }
    lock_guard<std::mutex> guard(transportMutex);
    auto it = forwardedPorts.find(remotePort);
    if (it == forwardedPorts.end()) {
      return nullopt;
    }
    return it->second;
  }

  virtual shared_ptr<SecureShellChannel> openShell(
      const PortMapping& sshMapping, const TerminalSize& size) {
    log->add(name + ":openShell");
    if (failShellOpen) {
      throw BridgeError("ssh handshake failed");
    }
    shell = make_shared<FakeShellChannel>(name, log);
    shell->openedWith = size;
    shell->sshMapping = sshMapping;
    return shell;
  }

  virtual shared_ptr<RpcFacility> getRpcFacility() { return rpcFacility; }

  virtual void dispose() {
    disposeCount++;
    log->add(name + ":transport.dispose");
    if (disposeThrows) {
      throw ChannelFault("tunnel already gone");
    }
  }

  /** @brief Delivers a trace event to whatever sink is installed. */
  void emitTrace(TraceLevel level, int eventId, const string& message) {
    getTraceSink()->trace(level, eventId, message);
  }

  string name;
  shared_ptr<EventLog> log;
  vector<TunnelPort> ports;
  map<uint16_t, uint16_t> forwardedPorts;
  /** @brief Trace messages emitted while waiting for a forwarded port. */
  vector<string> tracesOnWait;
  bool failShellOpen;
  bool failListPorts;
  bool disposeThrows;
  atomic<int> disposeCount;
  shared_ptr<FakeShellChannel> shell;
  shared_ptr<FakeRpcFacility> rpcFacility;

 protected:
  std::mutex transportMutex;
  shared_ptr<TraceSink> traceSink;
};

class FakeCodespaceDirectory : public CodespaceDirectory {
 public:
  explicit FakeCodespaceDirectory(const string& _token)
      : token(_token), listCalls(0) {}

  virtual vector<CodespaceSummary> listCodespaces() {
    listCalls++;
    if (token == "bad-token") {
      throw DirectoryError("Bad credentials");
    }
    return codespaces;
  }

  virtual CodespaceConnectionInfo getConnectionInfo(
      const string& codespaceName) {
    if (token == "bad-token") {
      throw DirectoryError("Bad credentials");
    }
    for (const auto& codespace : codespaces) {
      if (codespace.name == codespaceName) {
        CodespaceConnectionInfo info;
        info.name = codespace.name;
        info.state = codespace.state;
        info.repositoryFullName = codespace.repositoryFullName;
        info.tunnelId = "tunnel-" + codespace.name;
        info.clusterId = "usw2";
        info.codespace = codespace.raw;
        return info;
      }
    }
    throw DirectoryError("Codespace not found: " + codespaceName);
  }

  string token;
  vector<CodespaceSummary> codespaces;
  atomic<int> listCalls;
};

inline CodespaceSummary makeCodespace(const string& name,
                                      const string& state = "Available") {
  CodespaceSummary summary;
  summary.name = name;
  summary.displayName = name;
  summary.state = state;
  summary.repositoryFullName = "octo/" + name;
  summary.raw = json{{"name", name},
                     {"state", state},
                     {"repository", json{{"full_name", "octo/" + name}}}};
  return summary;
}

class FakeCodespaceBackend : public CodespaceBackend {
 public:
  FakeCodespaceBackend()
      : log(make_shared<EventLog>()),
        failTransportOpen(false),
        failShellOpen(false) {
    codespaces.push_back(makeCodespace("alpha"));
    codespaces.push_back(makeCodespace("beta"));
    codespaces.push_back(makeCodespace("warming", "Starting"));
    codespaces.push_back(makeCodespace("asleep", "Shutdown"));
  }

  virtual shared_ptr<CodespaceDirectory> createDirectory(const string& token) {
    auto directory = make_shared<FakeCodespaceDirectory>(token);
    directory->codespaces = codespaces;
    lock_guard<std::mutex> guard(backendMutex);
    directories.push_back(directory);
    return directory;
  }

  virtual shared_ptr<RelayTransport> openTransport(
      const CodespaceConnectionInfo& info) {
    log->add(info.name + ":openTransport");
    if (failTransportOpen) {
      throw BridgeError("relay connection refused");
    }
    auto transport = make_shared<FakeRelayTransport>(info.name, log);
    transport->failShellOpen = failShellOpen;
    if (configureTransport) {
      configureTransport(transport);
    }
    lock_guard<std::mutex> guard(backendMutex);
    transports.push_back(transport);
    return transport;
  }

  shared_ptr<FakeRelayTransport> lastTransport() {
    lock_guard<std::mutex> guard(backendMutex);
    return transports.empty() ? nullptr : transports.back();
  }

  size_t transportCount() {
    lock_guard<std::mutex> guard(backendMutex);
    return transports.size();
  }

  shared_ptr<EventLog> log;
  vector<CodespaceSummary> codespaces;
  bool failTransportOpen;
  bool failShellOpen;
  /** @brief Runs on every transport before it is handed out. */
  std::function<void(shared_ptr<FakeRelayTransport>)> configureTransport;

 protected:
  std::mutex backendMutex;
  vector<shared_ptr<FakeCodespaceDirectory>> directories;
  vector<shared_ptr<FakeRelayTransport>> transports;
};

/** @brief Client channel that keeps every message it was asked to send. */
class RecordingClientChannel : public ClientChannel {
 public:
  RecordingClientChannel() : open(true) {}

  virtual void send(const string& payload) {
    lock_guard<std::mutex> guard(channelMutex);
    sent.push_back(payload);
  }

  virtual bool isOpen() { return open; }

  vector<json> getMessages() {
    lock_guard<std::mutex> guard(channelMutex);
    vector<json> messages;
    for (const auto& payload : sent) {
      messages.push_back(json::parse(payload));
    }
    return messages;
  }

  vector<json> getMessagesOfType(const string& type) {
    vector<json> matching;
    for (const auto& message : getMessages()) {
      if (message["type"] == type) {
        matching.push_back(message);
      }
    }
    return matching;
  }

  vector<string> getTypes() {
    vector<string> types;
    for (const auto& message : getMessages()) {
      types.push_back(message["type"].get<string>());
    }
    return types;
  }

  void clear() {
    lock_guard<std::mutex> guard(channelMutex);
    sent.clear();
  }

  atomic<bool> open;

 protected:
  std::mutex channelMutex;
  vector<string> sent;
};

/** @brief Session listener that keeps every notification. */
class RecordingSessionListener : public SessionEventListener {
 public:
  struct StateChange {
    string codespaceName;
    string state;
    optional<string> repositoryFullName;
    bool hasCodespaceData;
  };

  virtual void onCodespaceState(const string& codespaceName,
                                const string& state,
                                const optional<string>& repositoryFullName,
                                const optional<json>& codespaceData) {
    lock_guard<std::mutex> guard(listenerMutex);
    states.push_back(StateChange{codespaceName, state, repositoryFullName,
                                 codespaceData.has_value()});
  }

  virtual void onTerminalOutput(const string& data) {
    lock_guard<std::mutex> guard(listenerMutex);
    output += data;
  }

  virtual void onPortUpdate(const PortInformation& portInfo) {
    lock_guard<std::mutex> guard(listenerMutex);
    portUpdates.push_back(portInfo);
  }

  virtual void onError(const string& message) {
    lock_guard<std::mutex> guard(listenerMutex);
    errors.push_back(message);
  }

  vector<string> getErrors() {
    lock_guard<std::mutex> guard(listenerMutex);
    return errors;
  }

  vector<StateChange> getStates() {
    lock_guard<std::mutex> guard(listenerMutex);
    return states;
  }

  string getOutput() {
    lock_guard<std::mutex> guard(listenerMutex);
    return output;
  }

  vector<PortInformation> getPortUpdates() {
    lock_guard<std::mutex> guard(listenerMutex);
    return portUpdates;
  }

 protected:
  std::mutex listenerMutex;
  vector<StateChange> states;
  vector<string> errors;
  string output;
  vector<PortInformation> portUpdates;
};
}  // namespace tcode

#endif  // __TCODE_FAKE_CODESPACE_BACKEND__
