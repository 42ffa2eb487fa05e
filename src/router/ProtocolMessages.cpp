#include "ProtocolMessages.hpp"

#include "BridgeErrors.hpp"
#include "PortInfoConverter.hpp"

namespace tcode {
json ProtocolMessages::parse(const string& payload) {
  json message;
  try {
    message = json::parse(payload);
  } catch (const json::parse_error& pe) {
    throw ProtocolError(string("Invalid JSON: ") + pe.what());
  }
  if (!message.is_object()) {
    throw ProtocolError("Message is not a JSON object");
  }
  if (!jsonString(message, "type")) {
    throw ProtocolError("Message has no string 'type' field");
  }
  return message;
}

string ProtocolMessages::requireString(const json& message,
                                       const string& key) {
  auto value = jsonString(message, key);
  if (!value) {
    throw ProtocolError("Field '" + key + "' must be a string");
  }
  return *value;
}

int64_t ProtocolMessages::requireInteger(const json& message,
                                         const string& key) {
  auto value = jsonInteger(message, key);
  if (!value) {
    throw ProtocolError("Field '" + key + "' must be an integer");
  }
  return *value;
}

json ProtocolMessages::authenticated(bool success) {
  return json{{"type", MSG_AUTHENTICATED}, {"success", success}};
}

json ProtocolMessages::codespacesList(
    const vector<CodespaceSummary>& codespaces) {
  json data = json::array();
  for (const auto& codespace : codespaces) {
    if (codespace.raw.is_object()) {
      data.push_back(codespace.raw);
      continue;
    }
    data.push_back(json{
        {"name", codespace.name},
        {"display_name", codespace.displayName},
        {"state", codespace.state},
        {"repository", json{{"full_name", codespace.repositoryFullName}}},
    });
  }
  return json{{"type", MSG_CODESPACES_LIST}, {"data", data}};
}

json ProtocolMessages::output(const string& data) {
  return json{{"type", MSG_OUTPUT}, {"data", data}};
}

json ProtocolMessages::error(const string& message) {
  return json{{"type", MSG_ERROR}, {"message", message}};
}

json ProtocolMessages::codespaceState(
    const string& codespaceName, const string& state,
    const optional<string>& repositoryFullName,
    const optional<json>& codespaceData) {
  json message = {{"type", MSG_CODESPACE_STATE},
                  {"codespace_name", codespaceName},
                  {"state", state}};
  if (repositoryFullName) {
    message["repository_full_name"] = *repositoryFullName;
  }
  if (codespaceData && !codespaceData->is_null()) {
    message["codespace_data"] = *codespaceData;
  }
  return message;
}

json ProtocolMessages::portUpdate(const PortInformation& portInfo) {
  ForwardedPortInformation forwarded = PortInfoConverter::bundle(portInfo);
  return json{{"type", MSG_PORT_UPDATE},
              {"portCount", forwarded.allPorts.size()},
              {"ports", PortInfoConverter::toJson(forwarded.allPorts)},
              {"timestamp", forwarded.timestamp}};
}

json ProtocolMessages::portInfoResponse(const PortInformation& portInfo) {
  return json{
      {"type", MSG_PORT_INFO_RESPONSE},
      {"portInfo",
       PortInfoConverter::toJson(PortInfoConverter::bundle(portInfo))}};
}

json ProtocolMessages::disconnectedFromCodespace() {
  return json{{"type", MSG_DISCONNECTED_FROM_CODESPACE}};
}
}  // namespace tcode
