#ifndef __TCODE_SESSION__
#define __TCODE_SESSION__

#include "CodespaceBackend.hpp"
#include "GraceTimer.hpp"
#include "Headers.hpp"
#include "PortForwardingState.hpp"
#include "PortTypes.hpp"
#include "RelayTransport.hpp"

namespace tcode {
enum class SessionState {
  UNAUTHENTICATED,
  AUTHENTICATED,
  BRIDGING,
  BRIDGED,
  DRAINING,
  CLOSED,
};

inline string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::UNAUTHENTICATED:
      return "Unauthenticated";
    case SessionState::AUTHENTICATED:
      return "Authenticated";
    case SessionState::BRIDGING:
      return "Bridging";
    case SessionState::BRIDGED:
      return "Bridged";
    case SessionState::DRAINING:
      return "Draining";
    case SessionState::CLOSED:
      return "Closed";
  }
  return "Unknown";
}

/**
 * @brief Everything one browser connection owns. A bridge is live iff
 * `transport` is set; `shell` is only set while `transport` is.
 */
struct Session {
  string connectionId;
  SessionState state = SessionState::UNAUTHENTICATED;
  shared_ptr<CodespaceDirectory> directory;
  string codespaceName;
  shared_ptr<RelayTransport> transport;
  shared_ptr<SecureShellChannel> shell;
  shared_ptr<RpcFacility> rpcFacility;
  /** @brief Shared with the shell's output callback; cleared at teardown. */
  shared_ptr<atomic<bool>> outputEnabled;
  TerminalSize terminalSize;
  PortForwardingState portState;
  optional<PortInformation> portSnapshot;
};
}  // namespace tcode

#endif  // __TCODE_SESSION__
