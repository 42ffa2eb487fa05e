#ifndef __TCODE_PORT_INFO_CONVERTER__
#define __TCODE_PORT_INFO_CONVERTER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PortTypes.hpp"

namespace tcode {
/**
 * @brief Pure conversions from tunnel port records to the shapes sent to the
 * browser.
 */
class PortInfoConverter {
 public:
  /** @brief Projects a port record, stamping `isUserPort` verbatim. */
  static ForwardedPort toForwarded(const TunnelPort& port, bool isUserPort);

  /** @brief True iff the port carries the user-forwarded label. */
  static bool classifyUser(const TunnelPort& port);

  /**
   * @brief Converts every port in `all`; a port is a user port iff its
   * (clusterId, portNumber) appears in `userSubset`.
   */
  static vector<ForwardedPort> toForwardedMany(
      const vector<TunnelPort>& all, const vector<TunnelPort>& userSubset);

  /** @brief Builds the port info envelope stamped with the current time. */
  static ForwardedPortInformation bundle(
      const vector<TunnelPort>& userPorts,
      const vector<TunnelPort>& managementPorts,
      const vector<TunnelPort>& allPorts);

  /** @brief Same as above, keeping the snapshot's timestamp and error. */
  static ForwardedPortInformation bundle(const PortInformation& portInfo);

  /** @brief Classifies every record of `all` into a snapshot. */
  static PortInformation splitPorts(const vector<TunnelPort>& all);

  /**
   * @brief Synthesizes a port record from a mapping learned without the
   * tunnel service (listeners, traces).
   */
  static TunnelPort fromMapping(const PortMapping& mapping);

  static json toJson(const ForwardedPort& port);
  static json toJson(const vector<ForwardedPort>& ports);
  static json toJson(const ForwardedPortInformation& portInfo);
};
}  // namespace tcode

#endif  // __TCODE_PORT_INFO_CONVERTER__
