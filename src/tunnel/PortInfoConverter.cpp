#include "PortInfoConverter.hpp"

namespace tcode {
ForwardedPort PortInfoConverter::toForwarded(const TunnelPort& port,
                                             bool isUserPort) {
  ForwardedPort forwarded;
  forwarded.portNumber = port.portNumber;
  forwarded.protocol = port.protocol;
  forwarded.urls = port.portForwardingUris;
  forwarded.isUserPort = isUserPort;
  return forwarded;
}

bool PortInfoConverter::classifyUser(const TunnelPort& port) {
  return find(port.labels.begin(), port.labels.end(),
              USER_FORWARDED_PORT_LABEL) != port.labels.end();
}

vector<ForwardedPort> PortInfoConverter::toForwardedMany(
    const vector<TunnelPort>& all, const vector<TunnelPort>& userSubset) {
  set<pair<string, uint16_t>> userIdentities;
  for (const auto& port : userSubset) {
    userIdentities.insert(make_pair(port.clusterId, port.portNumber));
  }
  vector<ForwardedPort> retval;
  retval.reserve(all.size());
  for (const auto& port : all) {
    bool isUser = userIdentities.count(
                      make_pair(port.clusterId, port.portNumber)) > 0;
    retval.push_back(toForwarded(port, isUser));
  }
  return retval;
}

ForwardedPortInformation PortInfoConverter::bundle(
    const vector<TunnelPort>& userPorts,
    const vector<TunnelPort>& managementPorts,
    const vector<TunnelPort>& allPorts) {
  ForwardedPortInformation info;
  for (const auto& port : userPorts) {
    info.userPorts.push_back(toForwarded(port, true));
  }
  for (const auto& port : managementPorts) {
    info.managementPorts.push_back(toForwarded(port, false));
  }
  info.allPorts = toForwardedMany(allPorts, userPorts);
  info.timestamp = toIsoTimestamp(chrono::system_clock::now());
  return info;
}

ForwardedPortInformation PortInfoConverter::bundle(
    const PortInformation& portInfo) {
  ForwardedPortInformation info = bundle(
      portInfo.userPorts, portInfo.managementPorts, portInfo.allPorts);
  if (!portInfo.timestamp.empty()) {
    info.timestamp = portInfo.timestamp;
  }
  info.error = portInfo.error;
  return info;
}

PortInformation PortInfoConverter::splitPorts(const vector<TunnelPort>& all) {
  PortInformation info;
  info.allPorts = all;
  for (const auto& port : all) {
    if (classifyUser(port)) {
      info.userPorts.push_back(port);
    } else {
      info.managementPorts.push_back(port);
    }
  }
  info.timestamp = toIsoTimestamp(chrono::system_clock::now());
  return info;
}

TunnelPort PortInfoConverter::fromMapping(const PortMapping& mapping) {
  TunnelPort port;
  port.portNumber = mapping.remotePort;
  port.protocol = mapping.protocol.value_or("auto");
  bool internal = mapping.remotePort == CODESPACE_SSH_PORT ||
                  mapping.remotePort == CODESPACE_ALT_SSH_PORT ||
                  (mapping.remotePort >= CODESPACE_RPC_PORT &&
                   mapping.remotePort <= CODESPACE_MANAGEMENT_PORT_LAST);
  port.labels.push_back(internal ? INTERNAL_PORT_LABEL
                                 : USER_FORWARDED_PORT_LABEL);
  port.portForwardingUris.push_back("http://127.0.0.1:" +
                                    to_string(mapping.localPort));
  return port;
}

json PortInfoConverter::toJson(const ForwardedPort& port) {
  return json{{"portNumber", port.portNumber},
              {"protocol", port.protocol},
              {"urls", port.urls},
              {"isUserPort", port.isUserPort}};
}

json PortInfoConverter::toJson(const vector<ForwardedPort>& ports) {
  json array = json::array();
  for (const auto& port : ports) {
    array.push_back(toJson(port));
  }
  return array;
}

json PortInfoConverter::toJson(const ForwardedPortInformation& portInfo) {
  json envelope;
  envelope["userPorts"] = toJson(portInfo.userPorts);
  envelope["managementPorts"] = toJson(portInfo.managementPorts);
  envelope["allPorts"] = toJson(portInfo.allPorts);
  envelope["timestamp"] = portInfo.timestamp;
  if (portInfo.error) {
    envelope["error"] = *portInfo.error;
  }
  return envelope;
}
}  // namespace tcode
