#ifndef __TCODE_PROTOCOL_MESSAGES__
#define __TCODE_PROTOCOL_MESSAGES__

#include "CodespaceBackend.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PortTypes.hpp"

namespace tcode {
// Inbound message types
const string MSG_AUTHENTICATE = "authenticate";
const string MSG_LIST_CODESPACES = "list_codespaces";
const string MSG_CONNECT_CODESPACE = "connect_codespace";
const string MSG_DISCONNECT_CODESPACE = "disconnect_codespace";
const string MSG_INPUT = "input";
const string MSG_RESIZE = "resize";
const string MSG_GET_PORT_INFO = "get_port_info";
const string MSG_REFRESH_PORTS = "refresh_ports";

// Outbound message types
const string MSG_AUTHENTICATED = "authenticated";
const string MSG_CODESPACES_LIST = "codespaces_list";
const string MSG_OUTPUT = "output";
const string MSG_ERROR = "error";
const string MSG_CODESPACE_STATE = "codespace_state";
const string MSG_PORT_UPDATE = "port_update";
const string MSG_PORT_INFO_RESPONSE = "port_info_response";
const string MSG_DISCONNECTED_FROM_CODESPACE = "disconnected_from_codespace";

/**
 * @brief Parses and builds the JSON envelopes exchanged with the browser.
 */
class ProtocolMessages {
 public:
  /**
   * @brief Parses an inbound payload.
   * @throws ProtocolError unless it is a JSON object with a string `type`.
   */
  static json parse(const string& payload);

  /** @throws ProtocolError if `key` is missing or not a string. */
  static string requireString(const json& message, const string& key);
  /** @throws ProtocolError if `key` is missing or not an integer. */
  static int64_t requireInteger(const json& message, const string& key);

  static json authenticated(bool success);
  static json codespacesList(const vector<CodespaceSummary>& codespaces);
  static json output(const string& data);
  static json error(const string& message);
  static json codespaceState(const string& codespaceName, const string& state,
                             const optional<string>& repositoryFullName,
                             const optional<json>& codespaceData);
  static json portUpdate(const PortInformation& portInfo);
  static json portInfoResponse(const PortInformation& portInfo);
  static json disconnectedFromCodespace();
};
}  // namespace tcode

#endif  // __TCODE_PROTOCOL_MESSAGES__
