#ifndef __TCODE_PORT_TYPES__
#define __TCODE_PORT_TYPES__

#include "Headers.hpp"

namespace tcode {
/** @brief Which subsystem reported a port mapping. */
enum class PortProvenance {
  LISTENERS,
  WAIT_FOR_FORWARDED,
  TUNNEL_QUERY,
  TRACE_FALLBACK,
};

inline string provenanceToString(PortProvenance provenance) {
  switch (provenance) {
    case PortProvenance::LISTENERS:
      return "listeners";
    case PortProvenance::WAIT_FOR_FORWARDED:
      return "waitForForwarded";
    case PortProvenance::TUNNEL_QUERY:
      return "tunnelQuery";
    case PortProvenance::TRACE_FALLBACK:
      return "trace_fallback";
  }
  return "unknown";
}

/**
 * @brief A local port on this host that is bridged to a remote port inside
 * the codespace.
 */
struct PortMapping {
  uint16_t localPort = 0;
  uint16_t remotePort = 0;
  /** @brief Unset when the source did not say, "ipv6" or a named protocol. */
  optional<string> protocol;
  bool isActive = true;
  PortProvenance provenance = PortProvenance::TRACE_FALLBACK;
};

/** @brief Port record as reported by the tunnel service. */
struct TunnelPort {
  string clusterId;
  string tunnelId;
  uint16_t portNumber = 0;
  string protocol;
  vector<string> labels;
  vector<string> portForwardingUris;
};

/** @brief Port as sent to the browser. */
struct ForwardedPort {
  uint16_t portNumber = 0;
  string protocol;
  vector<string> urls;
  bool isUserPort = false;
};

/** @brief Snapshot of the ports of one bridged codespace. */
struct PortInformation {
  vector<TunnelPort> userPorts;
  vector<TunnelPort> managementPorts;
  vector<TunnelPort> allPorts;
  string timestamp;
  optional<string> error;
};

/** @brief Wire form of `PortInformation`. */
struct ForwardedPortInformation {
  vector<ForwardedPort> userPorts;
  vector<ForwardedPort> managementPorts;
  vector<ForwardedPort> allPorts;
  string timestamp;
  optional<string> error;
};
}  // namespace tcode

#endif  // __TCODE_PORT_TYPES__
