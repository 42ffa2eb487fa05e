#include "PortForwardingState.hpp"

namespace tcode {
namespace {
void replaceMapping(vector<PortMapping>* category, const PortMapping& mapping) {
  category->erase(remove_if(category->begin(), category->end(),
                            [&mapping](const PortMapping& existing) {
                              return existing.localPort == mapping.localPort ||
                                     existing.remotePort == mapping.remotePort;
                            }),
                  category->end());
  category->push_back(mapping);
}
}  // namespace

bool PortForwardingState::isManagementPort(uint16_t remotePort) {
  return remotePort >= CODESPACE_RPC_PORT &&
         remotePort <= CODESPACE_MANAGEMENT_PORT_LAST;
}

bool PortForwardingState::isSshPort(uint16_t remotePort) {
  return remotePort == CODESPACE_ALT_SSH_PORT ||
         remotePort == CODESPACE_SSH_PORT;
}

void PortForwardingState::merge(const vector<PortMapping>& mappings) {
  for (const auto& mapping : mappings) {
    if (mapping.remotePort == CODESPACE_RPC_PORT) {
      rpcPort = mapping;
    }
    if (isSshPort(mapping.remotePort)) {
      sshPort = mapping;
    }
    if (isManagementPort(mapping.remotePort)) {
      replaceMapping(&managementPorts, mapping);
    } else {
      replaceMapping(&userPorts, mapping);
    }
  }
  lastUpdated = chrono::system_clock::now();
}

void PortForwardingState::removeLocalPort(uint16_t localPort) {
  auto matches = [localPort](const PortMapping& m) {
    return m.localPort == localPort;
  };
  userPorts.erase(remove_if(userPorts.begin(), userPorts.end(), matches),
                  userPorts.end());
  managementPorts.erase(
      remove_if(managementPorts.begin(), managementPorts.end(), matches),
      managementPorts.end());
  if (rpcPort && rpcPort->localPort == localPort) {
    rpcPort.reset();
  }
  if (sshPort && sshPort->localPort == localPort) {
    sshPort.reset();
  }
  lastUpdated = chrono::system_clock::now();
}

void PortForwardingState::clear() {
  rpcPort.reset();
  sshPort.reset();
  userPorts.clear();
  managementPorts.clear();
  lastUpdated = chrono::system_clock::now();
}

vector<PortMapping> PortForwardingState::allMappings() const {
  vector<PortMapping> retval = managementPorts;
  retval.insert(retval.end(), userPorts.begin(), userPorts.end());
  return retval;
}

optional<PortMapping> PortForwardingState::findByRemotePort(
    uint16_t remotePort) const {
  for (const auto& mapping : allMappings()) {
    if (mapping.remotePort == remotePort && mapping.isActive) {
      return mapping;
    }
  }
  return nullopt;
}
}  // namespace tcode
