#include "DefaultCodespaceBackend.hpp"

#include "GitHubCodespaceDirectory.hpp"
#include "LogHandler.hpp"
#include "SubprocessRelayTransport.hpp"

namespace tcode {
DefaultCodespaceBackend::DefaultCodespaceBackend(const BridgeConfig& _config)
    : config(_config) {}

shared_ptr<CodespaceDirectory> DefaultCodespaceBackend::createDirectory(
    const string& token) {
  return make_shared<GitHubCodespaceDirectory>(token, config.githubApiHost);
}

shared_ptr<RelayTransport> DefaultCodespaceBackend::openTransport(
    const CodespaceConnectionInfo& info) {
  auto transport =
      make_shared<SubprocessRelayTransport>(info, config, TRANSPORT_LOGGER);
  transport->start();
  return transport;
}
}  // namespace tcode
