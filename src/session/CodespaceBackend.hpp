#ifndef __TCODE_CODESPACE_BACKEND__
#define __TCODE_CODESPACE_BACKEND__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RelayTransport.hpp"

namespace tcode {
const string CODESPACE_STATE_AVAILABLE = "Available";
const string CODESPACE_STATE_STARTING = "Starting";
const string CODESPACE_STATE_PROVISIONING = "Provisioning";
const string CODESPACE_STATE_CONNECTED = "Connected";
const string CODESPACE_STATE_DISCONNECTED = "Disconnected";
const string CODESPACE_STATE_SHUTDOWN = "Shutdown";

/** @brief One entry of the directory listing. */
struct CodespaceSummary {
  string name;
  string displayName;
  string state;
  string repositoryFullName;
  /** @brief The directory's full record, forwarded to the browser as-is. */
  json raw;
};

/** @brief What is needed to open a relay tunnel to one codespace. */
struct CodespaceConnectionInfo {
  string name;
  string state;
  string repositoryFullName;
  string tunnelId;
  string clusterId;
  string serviceUri;
  string connectAccessToken;
  json tunnelProperties;
  /** @brief The directory's full record for the codespace. */
  json codespace;
};

/**
 * @brief Lists codespaces and hands out their connection credentials.
 *
 * Every method throws `DirectoryError` on failure, including a rejected
 * token: tokens are only validated on first use.
 */
class CodespaceDirectory {
 public:
  virtual ~CodespaceDirectory() {}

  virtual vector<CodespaceSummary> listCodespaces() = 0;
  virtual CodespaceConnectionInfo getConnectionInfo(
      const string& codespaceName) = 0;
};

/**
 * @brief Creates the external collaborators a session needs.
 */
class CodespaceBackend {
 public:
  virtual ~CodespaceBackend() {}

  /** @brief Binds a directory client to `token`. Must not perform I/O. */
  virtual shared_ptr<CodespaceDirectory> createDirectory(
      const string& token) = 0;
  /**
   * @brief Opens a relay tunnel to the codespace.
   * @throws BridgeError when the tunnel cannot be established.
   */
  virtual shared_ptr<RelayTransport> openTransport(
      const CodespaceConnectionInfo& info) = 0;
};
}  // namespace tcode

#endif  // __TCODE_CODESPACE_BACKEND__
