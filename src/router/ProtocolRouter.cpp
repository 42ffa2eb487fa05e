#include "ProtocolRouter.hpp"

#include "BridgeErrors.hpp"
#include "ProtocolMessages.hpp"

namespace tcode {
/**
 * @brief Serializes session notifications onto the browser connection.
 */
class ConnectionEventListener : public SessionEventListener {
 public:
  explicit ConnectionEventListener(shared_ptr<ClientChannel> _channel)
      : channel(_channel) {}

  void onCodespaceState(const string& codespaceName, const string& state,
                        const optional<string>& repositoryFullName,
                        const optional<json>& codespaceData) override {
    send(ProtocolMessages::codespaceState(codespaceName, state,
                                          repositoryFullName, codespaceData));
  }

  void onTerminalOutput(const string& data) override {
    send(ProtocolMessages::output(data));
  }

  void onPortUpdate(const PortInformation& portInfo) override {
    send(ProtocolMessages::portUpdate(portInfo));
  }

  void onError(const string& message) override {
    send(ProtocolMessages::error(message));
  }

 protected:
  void send(const json& message) {
    if (channel->isOpen()) {
      // Shell output is arbitrary bytes, replace what is not valid UTF-8
      channel->send(message.dump(-1, ' ', false,
                                 json::error_handler_t::replace));
    }
  }

  shared_ptr<ClientChannel> channel;
};

ProtocolRouter::ProtocolRouter(shared_ptr<CodespaceBackend> _backend,
                               const BridgeConfig& _config,
                               shared_ptr<ThreadPool> _workerPool,
                               const string& _loggerId)
    : backend(_backend),
      config(_config),
      workerPool(_workerPool),
      loggerId(_loggerId),
      activeDrains(0) {}

ProtocolRouter::~ProtocolRouter() { shutdown(); }

string ProtocolRouter::newConnectionId() { return sole::uuid4().str(); }

void ProtocolRouter::onConnectionOpened(const string& connectionId,
                                        shared_ptr<ClientChannel> channel) {
  auto connection = make_shared<Connection>();
  connection->id = connectionId;
  connection->channel = channel;
  connection->session = make_shared<SessionLifecycleManager>(
      connectionId, backend, make_shared<ConnectionEventListener>(channel),
      config);
  // Shell hangups arrive on the shell's reader thread; handle them in order
  // with the connection's other operations
  weak_ptr<Connection> weakConnection = connection;
  connection->session->setTaskScheduler(
      [this, weakConnection](std::function<void()> task) {
        auto owner = weakConnection.lock();
        if (owner) {
          submit(owner, "shell_closed", task);
        }
      });

  lock_guard<std::mutex> guard(routerMutex);
  if (!connections.insert(make_pair(connectionId, connection)).second) {
    STFATAL << "Duplicate connection id: " << connectionId;
  }
  CLOG(INFO, loggerId.c_str())
      << "Client connected: " << connectionId << " (" << connections.size()
      << " active)";
}

void ProtocolRouter::onConnectionClosed(const string& connectionId) {
  shared_ptr<Connection> connection;
  {
    lock_guard<std::mutex> guard(routerMutex);
    auto it = connections.find(connectionId);
    if (it == connections.end()) {
      CLOG(WARNING, loggerId.c_str())
          << "Close for unknown connection: " << connectionId;
      return;
    }
    connection = it->second;
    connections.erase(it);
  }
  CLOG(INFO, loggerId.c_str()) << "Client disconnected: " << connectionId;
  closeConnection(connection);
}

void ProtocolRouter::handleMessage(const string& connectionId,
                                   const string& payload) {
  json message = ProtocolMessages::parse(payload);
  string type = message["type"].get<string>();

  auto connection = findConnection(connectionId);
  if (!connection) {
    CLOG(WARNING, loggerId.c_str())
        << "Dropping " << type << " for closed connection " << connectionId;
    return;
  }
  CVLOG(1, loggerId.c_str()) << "[" << connectionId << "] received " << type;

  try {
    dispatch(type, message, connection);
  } catch (const std::exception& e) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connectionId << "] " << type << " failed: " << e.what();
    sendMessage(connection, ProtocolMessages::error(e.what()));
  }
}

size_t ProtocolRouter::sessionCount() {
  lock_guard<std::mutex> guard(routerMutex);
  return connections.size();
}

shared_ptr<SessionLifecycleManager> ProtocolRouter::getSession(
    const string& connectionId) {
  auto connection = findConnection(connectionId);
  return connection ? connection->session : nullptr;
}

size_t ProtocolRouter::pendingGraceTimerCount() {
  lock_guard<std::mutex> guard(routerMutex);
  return count_if(graceTimers.begin(), graceTimers.end(),
                  [](const shared_ptr<GraceTimer>& graceTimer) {
                    return graceTimer->isPending();
                  });
}

void ProtocolRouter::waitForIdle() {
  unique_lock<std::mutex> lock(idleMutex);
  idleCondition.wait(lock, [this] { return activeDrains == 0; });
}

void ProtocolRouter::shutdown() {
  vector<shared_ptr<Connection>> remaining;
  {
    lock_guard<std::mutex> guard(routerMutex);
    for (auto& it : connections) {
      remaining.push_back(it.second);
    }
    connections.clear();
  }
  for (auto& connection : remaining) {
    closeConnection(connection);
  }
  waitForIdle();

  vector<shared_ptr<GraceTimer>> expiring;
  {
    lock_guard<std::mutex> guard(routerMutex);
    expiring.swap(graceTimers);
  }
  for (auto& graceTimer : expiring) {
    graceTimer->expireNow();
  }
}

void ProtocolRouter::dispatch(const string& type, const json& message,
                              shared_ptr<Connection> connection) {
  auto session = connection->session;
  if (type == MSG_AUTHENTICATE) {
    string token = ProtocolMessages::requireString(message, "token");
    session->authenticate(token);
    sendMessage(connection, ProtocolMessages::authenticated(true));
  } else if (type == MSG_LIST_CODESPACES) {
    submit(connection, type, [this, connection, session]() {
      sendMessage(connection, ProtocolMessages::codespacesList(
                                  session->listCodespaces()));
    });
  } else if (type == MSG_CONNECT_CODESPACE) {
    string codespaceName =
        ProtocolMessages::requireString(message, "codespace_name");
    submit(connection, type, [session, codespaceName]() {
      session->connectCodespace(codespaceName);
    });
  } else if (type == MSG_DISCONNECT_CODESPACE) {
    submit(connection, type, [this, connection, session]() {
      if (session->disconnectCodespace()) {
        sendMessage(connection,
                    ProtocolMessages::disconnectedFromCodespace());
      }
    });
  } else if (type == MSG_INPUT) {
    session->sendInput(ProtocolMessages::requireString(message, "data"));
  } else if (type == MSG_RESIZE) {
    int64_t cols = ProtocolMessages::requireInteger(message, "cols");
    int64_t rows = ProtocolMessages::requireInteger(message, "rows");
    if (cols <= 0 || rows <= 0) {
      throw ProtocolError("Terminal size must be positive");
    }
    // The pty keeps the viewport in unsigned shorts
    if (cols > USHRT_MAX || rows > USHRT_MAX) {
      throw ProtocolError("Terminal size is too large");
    }
    TerminalSize size;
    size.cols = int(cols);
    size.rows = int(rows);
    session->resize(size);
  } else if (type == MSG_GET_PORT_INFO) {
    sendMessage(connection,
                ProtocolMessages::portInfoResponse(session->getPortInfo()));
  } else if (type == MSG_REFRESH_PORTS) {
    submit(connection, type, [session]() { session->refreshPorts(); });
  } else {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connection->id << "] unknown message type: " << type;
  }
}

void ProtocolRouter::submit(shared_ptr<Connection> connection,
                            const string& type, std::function<void()> task) {
  if (!workerPool) {
    runGuarded(connection, type, task);
    return;
  }
  {
    lock_guard<std::mutex> guard(connection->taskMutex);
    connection->pendingTasks.push_back([this, connection, type, task]() {
      runGuarded(connection, type, task);
    });
    if (connection->draining) {
      return;
    }
    connection->draining = true;
  }
  {
    lock_guard<std::mutex> guard(idleMutex);
    activeDrains++;
  }
  workerPool->enqueue([this, connection]() { drainTasks(connection); });
}

void ProtocolRouter::drainTasks(shared_ptr<Connection> connection) {
  while (true) {
    std::function<void()> task;
    {
      lock_guard<std::mutex> guard(connection->taskMutex);
      if (connection->pendingTasks.empty()) {
        connection->draining = false;
        break;
      }
      task = std::move(connection->pendingTasks.front());
      connection->pendingTasks.pop_front();
    }
    task();
  }
  {
    lock_guard<std::mutex> guard(idleMutex);
    activeDrains--;
  }
  idleCondition.notify_all();
}

void ProtocolRouter::runGuarded(shared_ptr<Connection> connection,
                                const string& type,
                                const std::function<void()>& task) {
  try {
    task();
  } catch (const std::exception& e) {
    CLOG(WARNING, loggerId.c_str())
        << "[" << connection->id << "] " << type << " failed: " << e.what();
    sendMessage(connection, ProtocolMessages::error(e.what()));
  }
}

void ProtocolRouter::sendMessage(shared_ptr<Connection> connection,
                                 const json& message) {
  if (!connection->channel->isOpen()) {
    CVLOG(1, loggerId.c_str())
        << "[" << connection->id << "] channel closed, dropping "
        << message["type"].get<string>();
    return;
  }
  connection->channel->send(
      message.dump(-1, ' ', false, json::error_handler_t::replace));
}

void ProtocolRouter::closeConnection(shared_ptr<Connection> connection) {
  submit(connection, "close", [this, connection]() {
    auto graceTimer = connection->session->close();
    if (graceTimer) {
      keepGraceTimer(graceTimer);
    }
  });
}

void ProtocolRouter::keepGraceTimer(shared_ptr<GraceTimer> graceTimer) {
  vector<shared_ptr<GraceTimer>> finished;
  lock_guard<std::mutex> guard(routerMutex);
  // Finished timers are destroyed outside the lock
  auto it = partition(graceTimers.begin(), graceTimers.end(),
                      [](const shared_ptr<GraceTimer>& timer) {
                        return timer->isPending();
                      });
  finished.assign(it, graceTimers.end());
  graceTimers.erase(it, graceTimers.end());
  graceTimers.push_back(graceTimer);
}

shared_ptr<ProtocolRouter::Connection> ProtocolRouter::findConnection(
    const string& connectionId) {
  lock_guard<std::mutex> guard(routerMutex);
  auto it = connections.find(connectionId);
  if (it == connections.end()) {
    return nullptr;
  }
  return it->second;
}
}  // namespace tcode
