#ifndef __TCODE_SESSION_EVENT_LISTENER__
#define __TCODE_SESSION_EVENT_LISTENER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PortTypes.hpp"

namespace tcode {
/**
 * @brief Receives the notifications a session produces on its own, outside
 * of a direct reply to a client request.
 */
class SessionEventListener {
 public:
  virtual ~SessionEventListener() {}

  virtual void onCodespaceState(const string& codespaceName,
                                const string& state,
                                const optional<string>& repositoryFullName,
                                const optional<json>& codespaceData) = 0;
  /** @brief Shell output; may be called from the shell's reader thread. */
  virtual void onTerminalOutput(const string& data) = 0;
  virtual void onPortUpdate(const PortInformation& portInfo) = 0;
  /** @brief A failure the client did not ask about, such as a dead shell. */
  virtual void onError(const string& message) = 0;
};
}  // namespace tcode

#endif  // __TCODE_SESSION_EVENT_LISTENER__
