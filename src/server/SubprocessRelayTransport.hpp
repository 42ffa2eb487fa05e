#ifndef __TCODE_SUBPROCESS_RELAY_TRANSPORT__
#define __TCODE_SUBPROCESS_RELAY_TRANSPORT__

#include "BridgeConfig.hpp"
#include "CodespaceBackend.hpp"
#include "Headers.hpp"
#include "RelayTransport.hpp"

namespace tcode {
/**
 * @brief Relay transport that delegates the tunnel to an external forwarder
 * command and reports every line it prints as a trace event.
 */
class SubprocessRelayTransport : public RelayTransport {
 public:
  SubprocessRelayTransport(const CodespaceConnectionInfo& _info,
                           const BridgeConfig& _config,
                           const string& _loggerId);
  virtual ~SubprocessRelayTransport();

  /**
   * @brief Launches the forwarder.
   * @throws BridgeError if it cannot be started.
   */
  void start();

  virtual shared_ptr<TraceSink> getTraceSink();
  virtual void setTraceSink(shared_ptr<TraceSink> sink);

  virtual vector<TunnelPort> listPorts();
  virtual optional<uint16_t> waitForForwardedPort(uint16_t remotePort,
                                                  chrono::milliseconds timeout);
  virtual shared_ptr<SecureShellChannel> openShell(
      const PortMapping& sshMapping, const TerminalSize& size);
  virtual shared_ptr<RpcFacility> getRpcFacility();
  virtual void dispose();

 protected:
  void readLoop();
  void handleLine(const string& line);
  void emitTrace(TraceLevel level, const string& message);
  bool isRunning();

  CodespaceConnectionInfo info;
  BridgeConfig config;
  string loggerId;

  pid_t forwarderPid;
  int outputFd;
  std::thread readerThread;
  atomic<bool> disposed;
  int nextEventId;

  std::mutex sinkMutex;
  shared_ptr<TraceSink> traceSink;

  std::mutex portMutex;
  std::condition_variable portCondition;
  map<uint16_t, uint16_t> remoteToLocal;
  bool forwarderExited;
};
}  // namespace tcode

#endif  // __TCODE_SUBPROCESS_RELAY_TRANSPORT__
