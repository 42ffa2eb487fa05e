#ifndef __TCODE_DEFAULT_CODESPACE_BACKEND__
#define __TCODE_DEFAULT_CODESPACE_BACKEND__

#include "BridgeConfig.hpp"
#include "CodespaceBackend.hpp"
#include "Headers.hpp"

namespace tcode {
/**
 * @brief Production backend: GitHub for the directory, the forwarder
 * subprocess for the tunnel.
 */
class DefaultCodespaceBackend : public CodespaceBackend {
 public:
  explicit DefaultCodespaceBackend(const BridgeConfig& _config);

  virtual shared_ptr<CodespaceDirectory> createDirectory(const string& token);
  virtual shared_ptr<RelayTransport> openTransport(
      const CodespaceConnectionInfo& info);

 protected:
  BridgeConfig config;
};
}  // namespace tcode

#endif  // __TCODE_DEFAULT_CODESPACE_BACKEND__
