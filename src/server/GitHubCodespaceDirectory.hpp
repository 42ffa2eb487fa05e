#ifndef __TCODE_GITHUB_CODESPACE_DIRECTORY__
#define __TCODE_GITHUB_CODESPACE_DIRECTORY__

#include "CodespaceBackend.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tcode {
const string GITHUB_USER_AGENT = "tcode-server/" TCODE_VERSION;

/**
 * @brief Codespace directory backed by the GitHub REST API.
 */
class GitHubCodespaceDirectory : public CodespaceDirectory {
 public:
  GitHubCodespaceDirectory(const string& _token, const string& _apiHost);

  virtual vector<CodespaceSummary> listCodespaces();
  virtual CodespaceConnectionInfo getConnectionInfo(
      const string& codespaceName);

  /** @brief Builds a summary from one entry of the list response. */
  static CodespaceSummary parseSummary(const json& codespace);
  /**
   * @brief Builds connection info from the single codespace response.
   * @throws DirectoryError if an Available codespace carries no tunnel
   * properties.
   */
  static CodespaceConnectionInfo parseConnectionInfo(const json& codespace);

 protected:
  /**
   * @throws DirectoryError on transport failure or an error status.
   * `notFoundMessage`, when set, replaces the generic 404 message.
   */
  json get(const string& path, bool acceptV3, const string& notFoundMessage);

  string token;
  string apiHost;
};
}  // namespace tcode

#endif  // __TCODE_GITHUB_CODESPACE_DIRECTORY__
