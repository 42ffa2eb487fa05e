#ifndef __TCODE_PORT_FORWARDING_STATE__
#define __TCODE_PORT_FORWARDING_STATE__

#include "Headers.hpp"
#include "PortTypes.hpp"

namespace tcode {
/**
 * @brief Merged view of the port mappings reported by every source for one
 * bridged codespace.
 *
 * Mappings to 16634..16640 are management ports (16634 is the RPC port),
 * mappings to 22 or 2222 are additionally remembered as the SSH port, and
 * everything else is a user port. Not thread safe; owned by one session.
 */
class PortForwardingState {
 public:
  /**
   * @brief Adds mappings, replacing any entry of the same category that
   * shares the local or the remote port.
   */
  void merge(const vector<PortMapping>& mappings);
  /** @brief Forgets every mapping that uses `localPort`. */
  void removeLocalPort(uint16_t localPort);
  void clear();

  optional<PortMapping> getRpcPort() const { return rpcPort; }
  optional<PortMapping> getSshPort() const { return sshPort; }
  const vector<PortMapping>& getUserPorts() const { return userPorts; }
  const vector<PortMapping>& getManagementPorts() const {
    return managementPorts;
  }
  /** @brief Management mappings followed by user mappings. */
  vector<PortMapping> allMappings() const;
  /** @brief Active mapping for `remotePort`, if any. */
  optional<PortMapping> findByRemotePort(uint16_t remotePort) const;
  chrono::system_clock::time_point getLastUpdated() const {
    return lastUpdated;
  }

  static bool isManagementPort(uint16_t remotePort);
  static bool isSshPort(uint16_t remotePort);

 protected:
  optional<PortMapping> rpcPort;
  optional<PortMapping> sshPort;
  vector<PortMapping> userPorts;
  vector<PortMapping> managementPorts;
  chrono::system_clock::time_point lastUpdated;
};
}  // namespace tcode

#endif  // __TCODE_PORT_FORWARDING_STATE__
