#ifndef __TCODE_BRIDGE_CONFIG__
#define __TCODE_BRIDGE_CONFIG__

#include "Headers.hpp"

namespace tcode {
/**
 * @brief Settings shared by the router, every session and every tracker.
 *
 * Values are read once when a session or tracker is constructed, so changing
 * them only affects sessions created afterwards.
 */
struct BridgeConfig {
  string bindIp = "0.0.0.0";
  int port = 3000;
  int workerThreads = 4;

  /** @brief Enables verbose logging of categorized transport traces. */
  bool debugTrace = false;
  /** @brief How long an RPC facility survives its client disconnecting. */
  chrono::milliseconds gracePeriod = chrono::milliseconds(30000);
  /** @brief Capacity of each session's trace history. */
  size_t maxTraceHistory = 100;

  uint16_t sshRemotePort = CODESPACE_SSH_PORT;
  string sshUser = "codespace";
  chrono::milliseconds portWaitTimeout = chrono::milliseconds(5000);
  /**
   * @brief Command that keeps the relay tunnel open. Placeholders:
   * {codespace}, {tunnel_id}, {cluster_id}, {ssh_port}.
   */
  string forwarderCommand =
      "gh codespace ports forward {ssh_port}:{ssh_port} -c {codespace}";

  string githubApiHost = "api.github.com";

  string logDirectory = "";
  string maxLogSize = "20971520";
  int verbose = 0;

  /**
   * @brief Overlays values from an INI file.
   * @throws std::runtime_error if the file cannot be parsed.
   */
  void applyIniFile(const string& filename);

  /** @brief Overlays DEBUG_TRACE, RPC_SESSION_KEEPALIVE and PORT. */
  void applyEnvironment();
};
}  // namespace tcode

#endif  // __TCODE_BRIDGE_CONFIG__
