#ifndef __TCODE_BRIDGE_ERRORS__
#define __TCODE_BRIDGE_ERRORS__

#include "Headers.hpp"

namespace tcode {
/**
 * @brief Thrown when an inbound client message is not a JSON object with a
 * string `type`, or when a known message carries malformed fields.
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown when an operation needs a bound directory token and there is
 * none, or when a session tries to bind a second token.
 */
class AuthError : public std::runtime_error {
 public:
  explicit AuthError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown by the codespace directory: listing failed, codespace unknown
 * or not in a connectable state.
 */
class DirectoryError : public std::runtime_error {
 public:
  explicit DirectoryError(const string& msg, bool _retryable = false,
                          const string& _codespaceState = "")
      : std::runtime_error(msg),
        retryable(_retryable),
        codespaceState(_codespaceState) {}

  /** @brief True when the codespace is expected to become available. */
  bool isRetryable() const { return retryable; }
  /** @brief Directory state reported for the codespace, empty if unknown. */
  const string& getCodespaceState() const { return codespaceState; }

 protected:
  bool retryable;
  string codespaceState;
};

/**
 * @brief Thrown when the relay transport or the shell channel cannot be
 * opened.
 */
class BridgeError : public std::runtime_error {
 public:
  explicit BridgeError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Benign failure while disposing an already torn down shell or
 * transport. Callers log and swallow it.
 */
class ChannelFault : public std::runtime_error {
 public:
  explicit ChannelFault(const string& msg) : std::runtime_error(msg) {}
};
}  // namespace tcode

#endif  // __TCODE_BRIDGE_ERRORS__
