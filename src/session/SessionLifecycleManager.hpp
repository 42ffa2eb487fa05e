#ifndef __TCODE_SESSION_LIFECYCLE_MANAGER__
#define __TCODE_SESSION_LIFECYCLE_MANAGER__

#include "BridgeConfig.hpp"
#include "CodespaceBackend.hpp"
#include "GraceTimer.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "PortMappingTracker.hpp"
#include "Session.hpp"
#include "SessionEventListener.hpp"

namespace tcode {
/**
 * @brief Owns the bridge between one browser connection and at most one
 * codespace.
 *
 * Connect, disconnect, refresh and close are serialized by a lifecycle lock.
 * Input, resize and port queries only take a short lock to copy the current
 * handles, so they never wait behind a connect that is in progress.
 */
class SessionLifecycleManager {
 public:
  SessionLifecycleManager(const string& _connectionId,
                          shared_ptr<CodespaceBackend> _backend,
                          shared_ptr<SessionEventListener> _listener,
                          const BridgeConfig& _config,
                          const string& _loggerId = SESSION_LOGGER);
  virtual ~SessionLifecycleManager();

  /**
   * @brief Binds the directory token for the lifetime of the session.
   * @throws AuthError if a token is already bound.
   */
  void authenticate(const string& token);

  /** @throws AuthError, DirectoryError */
  vector<CodespaceSummary> listCodespaces();

  /**
   * @brief Bridges the session to `codespaceName`, replacing any bridge that
   * is already live.
   *
   * On failure every partially acquired resource is released in reverse
   * order, the session is left authenticated with no bridge, and the error
   * is rethrown.
   * @throws AuthError, DirectoryError, BridgeError
   */
  void connectCodespace(const string& codespaceName);

  /**
   * @brief Runs follow-up work that must not happen on the thread that
   * reported it, such as tearing down after a shell ended on its own. Without
   * a scheduler the work runs on the reporting thread.
   */
  void setTaskScheduler(
      std::function<void(std::function<void()>)> _taskScheduler) {
    taskScheduler = _taskScheduler;
  }

  /**
   * @brief Tears the bridge down after `shell` ended on its own and reports
   * an error followed by a Shutdown state. Does nothing if `shell` no longer
   * belongs to the live bridge.
   */
  void handleShellClosed(shared_ptr<SecureShellChannel> shell,
                         const string& reason);

  /**
   * @brief Tears down the live bridge.
   * @return false if there was no bridge.
   */
  bool disconnectCodespace();

  /** @brief Writes to the shell; dropped when there is no bridge. */
  void sendInput(const string& data);
  /** @brief Resizes the shell and remembers the size for later bridges. */
  void resize(const TerminalSize& size);

  /** @brief Cached snapshot, or an empty one when nothing is bridged. */
  PortInformation getPortInfo();
  /**
   * @brief Re-queries the tunnel and publishes the result. Without a bridge
   * this is the same as `getPortInfo`.
   */
  PortInformation refreshPorts();

  /**
   * @brief Releases every resource. The RPC facility is marked disconnected
   * and handed to the returned timer, which disposes it once the grace
   * period ends. Returns null if there was no facility or the session was
   * already closed.
   */
  shared_ptr<GraceTimer> close();

  SessionState getState();
  string getCodespaceName();
  bool isAuthenticated();
  bool isBridged();
  const string& getConnectionId() const { return connectionId; }
  shared_ptr<PortMappingTracker> getTracker() { return tracker; }

 protected:
  struct BridgeHandles {
    shared_ptr<RelayTransport> transport;
    shared_ptr<SecureShellChannel> shell;
    shared_ptr<RpcFacility> rpcFacility;
    shared_ptr<atomic<bool>> outputEnabled;
  };

  shared_ptr<CodespaceDirectory> requireDirectory();
  void setState(SessionState newState);

  CodespaceConnectionInfo resolveCodespace(
      shared_ptr<CodespaceDirectory> directory, const string& codespaceName);
  BridgeHandles bridgeTo(const string& codespaceName);
  void watchShell(shared_ptr<SecureShellChannel> shell,
                  shared_ptr<atomic<bool>> outputEnabled);
  PortMapping locateSshPort(shared_ptr<RelayTransport> transport);
  PortInformation takePortSnapshot(shared_ptr<RelayTransport> transport);

  BridgeHandles detachHandles();
  void teardownBridge();
  void rollbackBridge(BridgeHandles* handles);
  void reportConnectFailure(const string& codespaceName, const string& state);

  void closeShell(shared_ptr<SecureShellChannel> shell);
  void disposeTransport(shared_ptr<RelayTransport> transport);
  void disposeRpcFacility(shared_ptr<RpcFacility> rpcFacility);

  static optional<uint16_t> extractLocalPort(const string& uri);

  string connectionId;
  shared_ptr<CodespaceBackend> backend;
  shared_ptr<SessionEventListener> listener;
  BridgeConfig config;
  string loggerId;
  shared_ptr<PortMappingTracker> tracker;
  std::function<void(std::function<void()>)> taskScheduler;

  std::mutex lifecycleMutex;
  std::mutex stateMutex;
  Session session;
};
}  // namespace tcode

#endif  // __TCODE_SESSION_LIFECYCLE_MANAGER__
