#ifndef __TCODE_PROTOCOL_ROUTER__
#define __TCODE_PROTOCOL_ROUTER__

#include "BridgeConfig.hpp"
#include "ClientChannel.hpp"
#include "CodespaceBackend.hpp"
#include "GraceTimer.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "LogHandler.hpp"
#include "SessionLifecycleManager.hpp"

namespace tcode {
/**
 * @brief Maps browser connections to sessions and dispatches their messages.
 *
 * Operations that talk to the directory or the transport run on the worker
 * pool, one at a time per connection and in arrival order. Without a pool
 * they run on the calling thread.
 */
class ProtocolRouter {
 public:
  ProtocolRouter(shared_ptr<CodespaceBackend> _backend,
                 const BridgeConfig& _config,
                 shared_ptr<ThreadPool> _workerPool = nullptr,
                 const string& _loggerId = ROUTER_LOGGER);
  virtual ~ProtocolRouter();

  /** @brief Generates an identity for a new connection. */
  static string newConnectionId();

  /** @brief Creates the session for a connection that was just accepted. */
  void onConnectionOpened(const string& connectionId,
                          shared_ptr<ClientChannel> channel);
  /**
   * @brief Closes the session of a connection that went away. The RPC
   * facility outlives it for the grace period.
   */
  void onConnectionClosed(const string& connectionId);

  /**
   * @brief Handles one inbound payload.
   *
   * Errors raised by the dispatched operation are reported to the
   * connection as an `error` message.
   * @throws ProtocolError if the payload is not a JSON object with a string
   * `type`. Nothing is sent to the connection in that case.
   */
  void handleMessage(const string& connectionId, const string& payload);

  size_t sessionCount();
  shared_ptr<SessionLifecycleManager> getSession(const string& connectionId);
  size_t pendingGraceTimerCount();

  /** @brief Blocks until no queued operation is left on the worker pool. */
  void waitForIdle();
  /**
   * @brief Closes every session and expires every pending grace timer.
   */
  void shutdown();

 protected:
  struct Connection {
    string id;
    shared_ptr<ClientChannel> channel;
    shared_ptr<SessionLifecycleManager> session;

    std::mutex taskMutex;
    deque<std::function<void()>> pendingTasks;
    bool draining = false;
  };

  void dispatch(const string& type, const json& message,
                shared_ptr<Connection> connection);
  void submit(shared_ptr<Connection> connection, const string& type,
              std::function<void()> task);
  void drainTasks(shared_ptr<Connection> connection);
  void runGuarded(shared_ptr<Connection> connection, const string& type,
                  const std::function<void()>& task);
  void sendMessage(shared_ptr<Connection> connection, const json& message);
  void closeConnection(shared_ptr<Connection> connection);
  void keepGraceTimer(shared_ptr<GraceTimer> graceTimer);
  shared_ptr<Connection> findConnection(const string& connectionId);

  shared_ptr<CodespaceBackend> backend;
  BridgeConfig config;
  shared_ptr<ThreadPool> workerPool;
  string loggerId;

  std::mutex routerMutex;
  unordered_map<string, shared_ptr<Connection>> connections;
  vector<shared_ptr<GraceTimer>> graceTimers;

  std::mutex idleMutex;
  std::condition_variable idleCondition;
  int activeDrains;
};
}  // namespace tcode

#endif  // __TCODE_PROTOCOL_ROUTER__
