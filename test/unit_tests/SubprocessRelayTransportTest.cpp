#include "BridgeErrors.hpp"
#include "LogHandler.hpp"
#include "SubprocessRelayTransport.hpp"
#include "TestHeaders.hpp"

using namespace tcode;

namespace {
class RecordingTraceSink : public TraceSink {
 public:
  void trace(TraceLevel level, int, const string& message) override {
    lock_guard<std::mutex> guard(sinkMutex);
    messages.push_back(make_pair(level, message));
  }

  vector<pair<TraceLevel, string>> getMessages() {
    lock_guard<std::mutex> guard(sinkMutex);
    return messages;
  }

 protected:
  std::mutex sinkMutex;
  vector<pair<TraceLevel, string>> messages;
};

CodespaceConnectionInfo connectionInfo() {
  CodespaceConnectionInfo info;
  info.name = "octo-alpha";
  info.tunnelId = "tun-123";
  info.clusterId = "usw2";
  return info;
}
}  // namespace

TEST_CASE("Forwarder announcements resolve forwarded ports",
          "[SubprocessRelayTransport]") {
  BridgeConfig config;
  config.forwarderCommand =
      "echo Forwarding from 127.0.0.1:40022 to host port {ssh_port}.";
  auto sink = make_shared<RecordingTraceSink>();
  SubprocessRelayTransport transport(connectionInfo(), config,
                                     TRANSPORT_LOGGER);
  transport.setTraceSink(sink);
  transport.start();

  auto localPort =
      transport.waitForForwardedPort(2222, chrono::milliseconds(5000));
  REQUIRE(localPort.has_value());
  REQUIRE(*localPort == 40022);
  REQUIRE(transport.listPorts().empty());
  REQUIRE(transport.getRpcFacility() == nullptr);

  transport.dispose();
  REQUIRE_THROWS_AS(transport.dispose(), ChannelFault);

  auto messages = sink->getMessages();
  REQUIRE(messages.size() >= 3);
  REQUIRE(messages[0].second == "Connecting to tunnel tun-123");
  REQUIRE(messages[1].first == TraceLevel::INFO);
  REQUIRE(messages[1].second ==
          "Forwarding from 127.0.0.1:40022 to host port 2222.");
  REQUIRE(messages.back().second == "Tunnel disconnected");
}

TEST_CASE("A forwarder that exits forwards nothing",
          "[SubprocessRelayTransport]") {
  BridgeConfig config;
  config.forwarderCommand = "echo fatal error: tunnel {tunnel_id} not found";
  auto sink = make_shared<RecordingTraceSink>();
  SubprocessRelayTransport transport(connectionInfo(), config,
                                     TRANSPORT_LOGGER);
  transport.setTraceSink(sink);
  transport.start();

  REQUIRE_FALSE(
      transport.waitForForwardedPort(2222, chrono::milliseconds(5000)));
  PortMapping sshMapping;
  sshMapping.localPort = 40022;
  sshMapping.remotePort = 2222;
  REQUIRE_THROWS_AS(transport.openShell(sshMapping, TerminalSize()),
                    BridgeError);

  transport.dispose();
  auto messages = sink->getMessages();
  REQUIRE(messages.size() >= 3);
  REQUIRE(messages[1].first == TraceLevel::ERROR);
  REQUIRE(messages[1].second == "fatal error: tunnel tun-123 not found");
  REQUIRE(messages.back().second == "Tunnel disconnected");
}
