#ifndef __TCODE_RELAY_TRANSPORT__
#define __TCODE_RELAY_TRANSPORT__

#include "Headers.hpp"
#include "PortTypes.hpp"
#include "TraceSink.hpp"

namespace tcode {
/** @brief Terminal geometry requested by the browser. */
struct TerminalSize {
  int cols = 80;
  int rows = 24;
};

/**
 * @brief Interactive shell running inside the codespace, reached through the
 * relay transport.
 */
class SecureShellChannel {
 public:
  virtual ~SecureShellChannel() {}

  /**
   * @brief Installs the callback that receives shell output. Only the most
   * recently installed callback is invoked. Output that arrived before any
   * callback was installed is delivered to it first, in order.
   */
  virtual void setDataCallback(std::function<void(const string&)> callback) = 0;
  /**
   * @brief Installs the callback invoked once when the remote end of the
   * shell goes away on its own. It is not invoked for `close()`. If the shell
   * already ended, the callback runs right away.
   *
   * The callback may run on the channel's reader thread and must not call
   * `close()` from there.
   */
  virtual void setCloseCallback(
      std::function<void(const string& reason)> callback) = 0;
  /** @brief Sends keystrokes to the shell. */
  virtual void write(const string& data) = 0;
  /** @brief Changes the shell viewport. */
  virtual void resize(const TerminalSize& size) = 0;
  /**
   * @brief Closes the shell.
   * @throws ChannelFault if the shell was already torn down underneath us.
   */
  virtual void close() = 0;
};

/**
 * @brief Out-of-band RPC connection to the codespace agent.
 *
 * When the browser connection drops the facility is only marked
 * disconnected; it is disposed once its grace period runs out.
 */
class RpcFacility {
 public:
  virtual ~RpcFacility() {}

  /** @brief Stops keepalive traffic while no client is attached. */
  virtual void markAsDisconnected() = 0;
  /**
   * @brief True while no session is associated with the facility. A
   * collaborator that supports re-association reports false again once a new
   * session picks it up.
   */
  virtual bool isDisconnected() = 0;
  /** @brief Releases the connection. */
  virtual void dispose() = 0;
};

/**
 * @brief Encrypted relay tunnel to one codespace.
 */
class RelayTransport {
 public:
  virtual ~RelayTransport() {}

  /** @brief Returns the sink that currently receives trace events. */
  virtual shared_ptr<TraceSink> getTraceSink() = 0;
  /** @brief Replaces the sink that receives trace events. */
  virtual void setTraceSink(shared_ptr<TraceSink> sink) = 0;

  /** @brief Port records known to the tunnel service. */
  virtual vector<TunnelPort> listPorts() = 0;
  /**
   * @brief Waits until `remotePort` is forwarded to this host.
   * @return The local port, or nullopt on timeout.
   */
  virtual optional<uint16_t> waitForForwardedPort(
      uint16_t remotePort, chrono::milliseconds timeout) = 0;
  /**
   * @brief Opens a shell over the forwarded SSH port.
   * @throws BridgeError when the shell cannot be started.
   */
  virtual shared_ptr<SecureShellChannel> openShell(
      const PortMapping& sshMapping, const TerminalSize& size) = 0;
  /** @brief RPC facility bound to this tunnel, or null if there is none. */
  virtual shared_ptr<RpcFacility> getRpcFacility() = 0;
  /**
   * @brief Closes the tunnel.
   * @throws ChannelFault if the tunnel already went away.
   */
  virtual void dispose() = 0;
};
}  // namespace tcode

#endif  // __TCODE_RELAY_TRANSPORT__
