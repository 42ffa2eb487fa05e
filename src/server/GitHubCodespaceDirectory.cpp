#include "GitHubCodespaceDirectory.hpp"

#include "BridgeErrors.hpp"
#include "LogHandler.hpp"
#include "httplib.h"

namespace tcode {
GitHubCodespaceDirectory::GitHubCodespaceDirectory(const string& _token,
                                                   const string& _apiHost)
    : token(_token), apiHost(_apiHost) {}

vector<CodespaceSummary> GitHubCodespaceDirectory::listCodespaces() {
  json response = get("/user/codespaces", true, "");
  vector<CodespaceSummary> codespaces;
  auto it = response.find("codespaces");
  if (it == response.end() || !it->is_array()) {
    return codespaces;
  }
  for (const auto& codespace : *it) {
    codespaces.push_back(parseSummary(codespace));
  }
  VLOG(1) << "Codespaces list parsed: " << codespaces.size();
  return codespaces;
}

CodespaceConnectionInfo GitHubCodespaceDirectory::getConnectionInfo(
    const string& codespaceName) {
  json response =
      get("/user/codespaces/" + codespaceName + "?internal=true&refresh=true",
          false, "Codespace not found: " + codespaceName);
  return parseConnectionInfo(response);
}

CodespaceSummary GitHubCodespaceDirectory::parseSummary(
    const json& codespace) {
  CodespaceSummary summary;
  summary.name = jsonString(codespace, "name").value_or("");
  summary.displayName =
      jsonString(codespace, "display_name").value_or(summary.name);
  summary.state = jsonString(codespace, "state").value_or("");
  if (codespace.contains("repository")) {
    summary.repositoryFullName =
        jsonString(codespace["repository"], "full_name").value_or("");
  }
  summary.raw = codespace;
  return summary;
}

CodespaceConnectionInfo GitHubCodespaceDirectory::parseConnectionInfo(
    const json& codespace) {
  CodespaceConnectionInfo info;
  info.name = jsonString(codespace, "name").value_or("");
  info.state = jsonString(codespace, "state").value_or("");
  if (codespace.contains("repository")) {
    info.repositoryFullName =
        jsonString(codespace["repository"], "full_name").value_or("");
  }
  info.codespace = codespace;

  if (!info.state.empty() && info.state != CODESPACE_STATE_AVAILABLE) {
    // Not connectable; the session reports the state
    return info;
  }
  if (!codespace.contains("connection") ||
      !codespace["connection"].contains("tunnelProperties") ||
      !codespace["connection"]["tunnelProperties"].is_object()) {
    throw DirectoryError(
        "Tunnel properties not found in response. Codespace may not be "
        "ready.");
  }
  info.tunnelProperties = codespace["connection"]["tunnelProperties"];
  info.tunnelId = jsonString(info.tunnelProperties, "tunnelId").value_or("");
  info.clusterId =
      jsonString(info.tunnelProperties, "clusterId").value_or("");
  info.serviceUri =
      jsonString(info.tunnelProperties, "serviceUri").value_or("");
  info.connectAccessToken =
      jsonString(info.tunnelProperties, "connectAccessToken").value_or("");
  return info;
}

json GitHubCodespaceDirectory::get(const string& path, bool acceptV3,
                                   const string& notFoundMessage) {
  httplib::Client client("https://" + apiHost);
  client.set_connection_timeout(10, 0);
  client.set_read_timeout(30, 0);
  httplib::Headers headers = {
      {"Authorization", "Bearer " + token},
      {"User-Agent", GITHUB_USER_AGENT},
  };
  if (acceptV3) {
    headers.emplace("Accept", "application/vnd.github.v3+json");
  }

  VLOG(1) << "GET https://" << apiHost << path;
  auto res = client.Get(path, headers);
  if (!res) {
    throw DirectoryError("GitHub API request failed: " +
                             httplib::to_string(res.error()),
                         true);
  }
  VLOG(1) << "GitHub API response " << res->status << " for " << path;
  if (res->status == 401) {
    throw DirectoryError("Bad credentials");
  }
  if (res->status == 404 && !notFoundMessage.empty()) {
    throw DirectoryError(notFoundMessage);
  }
  if (res->status >= 400) {
    throw DirectoryError("GitHub API Error: " + to_string(res->status) + " " +
                         res->body);
  }
  try {
    return json::parse(res->body);
  } catch (const json::parse_error& pe) {
    LOG(ERROR) << "Failed to parse GitHub response: " << pe.what();
    throw DirectoryError(string("Invalid GitHub API response: ") + pe.what());
  }
}
}  // namespace tcode
