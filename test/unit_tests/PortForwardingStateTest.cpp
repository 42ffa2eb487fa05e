#include "PortForwardingState.hpp"
#include "TestHeaders.hpp"

using namespace tcode;

namespace {
PortMapping mapping(uint16_t localPort, uint16_t remotePort,
                    PortProvenance provenance = PortProvenance::LISTENERS) {
  PortMapping m;
  m.localPort = localPort;
  m.remotePort = remotePort;
  m.provenance = provenance;
  return m;
}
}  // namespace

TEST_CASE("Merge sorts mappings into categories", "[PortForwardingState]") {
  PortForwardingState state;
  state.merge({mapping(40022, 2222), mapping(46634, 16634),
               mapping(46635, 16635), mapping(43000, 3000)});

  REQUIRE(state.getSshPort()->localPort == 40022);
  REQUIRE(state.getRpcPort()->localPort == 46634);
  REQUIRE(state.getManagementPorts().size() == 2);
  // SSH is not in the management range
  REQUIRE(state.getUserPorts().size() == 2);

  auto all = state.allMappings();
  REQUIRE(all.size() == 4);
  REQUIRE(all[0].remotePort == 16634);
  REQUIRE(all[1].remotePort == 16635);
}

TEST_CASE("Merge replaces entries sharing a port", "[PortForwardingState]") {
  PortForwardingState state;
  state.merge({mapping(43000, 3000, PortProvenance::TRACE_FALLBACK)});
  state.merge({mapping(43001, 3000, PortProvenance::TUNNEL_QUERY)});
  REQUIRE(state.getUserPorts().size() == 1);
  REQUIRE(state.getUserPorts()[0].localPort == 43001);
  REQUIRE(state.getUserPorts()[0].provenance == PortProvenance::TUNNEL_QUERY);

  // Same local port, different remote port
  state.merge({mapping(43001, 8080)});
  REQUIRE(state.getUserPorts().size() == 1);
  REQUIRE(state.getUserPorts()[0].remotePort == 8080);

  state.merge({mapping(22, 22)});
  REQUIRE(state.getSshPort()->remotePort == 22);
}

TEST_CASE("Removing a local port clears every reference",
          "[PortForwardingState]") {
  PortForwardingState state;
  state.merge({mapping(40022, 2222), mapping(46634, 16634)});
  state.removeLocalPort(40022);
  REQUIRE_FALSE(state.getSshPort().has_value());
  REQUIRE(state.getUserPorts().empty());
  REQUIRE(state.getRpcPort().has_value());

  state.clear();
  REQUIRE(state.allMappings().empty());
  REQUIRE_FALSE(state.getRpcPort().has_value());
}

TEST_CASE("Lookup by remote port skips inactive mappings",
          "[PortForwardingState]") {
  PortForwardingState state;
  auto inactive = mapping(45000, 5000);
  inactive.isActive = false;
  state.merge({inactive, mapping(43000, 3000)});
  REQUIRE_FALSE(state.findByRemotePort(5000).has_value());
  REQUIRE(state.findByRemotePort(3000)->localPort == 43000);
  REQUIRE(PortForwardingState::isManagementPort(16640));
  REQUIRE_FALSE(PortForwardingState::isManagementPort(16641));
  REQUIRE(PortForwardingState::isSshPort(22));
}
