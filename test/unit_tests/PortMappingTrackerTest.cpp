#include "FakeCodespaceBackend.hpp"
#include "LogHandler.hpp"
#include "PortMappingTracker.hpp"
#include "TestHeaders.hpp"

using namespace tcode;

namespace {
shared_ptr<PortMappingTracker> makeTracker(size_t capacity = 100) {
  return make_shared<PortMappingTracker>(capacity, false, TRACKER_LOGGER);
}
}  // namespace

TEST_CASE("Detach restores the exact original sink", "[PortMappingTracker]") {
  auto log = make_shared<EventLog>();
  auto transport = make_shared<FakeRelayTransport>("alpha", log);
  auto tracker = makeTracker();

  auto original = transport->getTraceSink();
  tracker->attachToClient(transport);
  REQUIRE(transport->getTraceSink() != original);
  REQUIRE(tracker->isAttachedTo(transport));

  tracker->detachFromClient(transport);
  REQUIRE(transport->getTraceSink() == original);
  REQUIRE_FALSE(tracker->isAttachedTo(transport));

  // Repeated cycles keep restoring the same sink
  for (int i = 0; i < 3; i++) {
    tracker->attachToClient(transport);
    tracker->detachFromClient(transport);
  }
  REQUIRE(transport->getTraceSink() == original);
}

TEST_CASE("Attaching twice does not stack interceptors",
          "[PortMappingTracker]") {
  auto log = make_shared<EventLog>();
  auto transport = make_shared<FakeRelayTransport>("alpha", log);
  auto tracker = makeTracker();

  auto original = transport->getTraceSink();
  auto first = tracker->subscribe(transport);
  auto second = tracker->subscribe(transport);
  REQUIRE(first == second);

  transport->emitTrace(TraceLevel::INFO, 1, "hello");
  REQUIRE(tracker->getTraceCount() == 1);

  tracker->unsubscribe(first);
  REQUIRE(transport->getTraceSink() == original);
  // A second unsubscribe of the same handle is a no-op
  tracker->unsubscribe(first);
  REQUIRE(transport->getTraceSink() == original);
}

TEST_CASE("Interceptor forwards to the original sink first",
          "[PortMappingTracker]") {
  auto log = make_shared<EventLog>();
  auto transport = make_shared<FakeRelayTransport>("alpha", log);
  vector<string> seen;
  transport->setTraceSink(make_shared<FunctionTraceSink>(
      [&seen](TraceLevel, int, const string& message) {
        seen.push_back(message);
      }));
  auto tracker = makeTracker();
  tracker->attachToClient(transport);

  transport->emitTrace(TraceLevel::INFO, 7, "Connected to relay");
  REQUIRE(seen == vector<string>{"Connected to relay"});
  auto traces = tracker->getRecentTraces();
  REQUIRE(traces.size() == 1);
  REQUIRE(traces[0].getEventId() == 7);
  REQUIRE(traces[0].getCategory() == TraceCategory::CONNECTION);
}

TEST_CASE("Interceptor outliving its tracker only forwards",
          "[PortMappingTracker]") {
  auto log = make_shared<EventLog>();
  auto transport = make_shared<FakeRelayTransport>("alpha", log);
  int forwarded = 0;
  transport->setTraceSink(make_shared<FunctionTraceSink>(
      [&forwarded](TraceLevel, int, const string&) { forwarded++; }));
  auto original = transport->getTraceSink();
  {
    auto tracker = makeTracker();
    tracker->attachToClient(transport);
  }
  // Destroying the tracker detaches it
  REQUIRE(transport->getTraceSink() == original);
  transport->emitTrace(TraceLevel::INFO, 1, "still flowing");
  REQUIRE(forwarded == 1);
}

TEST_CASE("Extracts port mappings from forwarding traces in order",
          "[PortMappingTracker]") {
  auto log = make_shared<EventLog>();
  auto transport = make_shared<FakeRelayTransport>("alpha", log);
  auto tracker = makeTracker();
  tracker->attachToClient(transport);

  transport->emitTrace(TraceLevel::INFO, 1,
                       "Forwarding from 127.0.0.1:54321 to host port 2222.");
  transport->emitTrace(TraceLevel::INFO, 2,
                       "Forwarding from ::1:54322 to host port 16634.");

  auto mappings = tracker->extractPortMappingsFromTraces();
  REQUIRE(mappings.size() == 2);

  REQUIRE(mappings[0].localPort == 54321);
  REQUIRE(mappings[0].remotePort == 2222);
  REQUIRE_FALSE(mappings[0].protocol.has_value());
  REQUIRE(mappings[0].isActive);
  REQUIRE(mappings[0].provenance == PortProvenance::TRACE_FALLBACK);

  REQUIRE(mappings[1].localPort == 54322);
  REQUIRE(mappings[1].remotePort == 16634);
  REQUIRE(mappings[1].protocol == string("ipv6"));
  REQUIRE(mappings[1].isActive);
  REQUIRE(mappings[1].provenance == PortProvenance::TRACE_FALLBACK);
}

TEST_CASE("Repeated forwarding traces are not de-duplicated",
          "[PortMappingTracker]") {
  auto tracker = makeTracker();
  tracker->recordTrace(TraceLevel::INFO, 1,
                       "Forwarding from 127.0.0.1:5000 to host port 3000");
  tracker->recordTrace(TraceLevel::INFO, 2,
                       "Forwarding from 127.0.0.1:5000 to host port 3000");
  REQUIRE(tracker->extractPortMappingsFromTraces().size() == 2);
}

TEST_CASE("History evicts the oldest traces first", "[PortMappingTracker]") {
  auto tracker = makeTracker(3);
  for (int i = 1; i <= 5; i++) {
    tracker->recordTrace(TraceLevel::INFO, i, "event " + to_string(i));
  }
  REQUIRE(tracker->getTraceCount() == 3);
  auto traces = tracker->getRecentTraces(10);
  REQUIRE(traces.size() == 3);
  REQUIRE(traces[0].getEventId() == 3);
  REQUIRE(traces[1].getEventId() == 4);
  REQUIRE(traces[2].getEventId() == 5);

  auto lastTwo = tracker->getRecentTraces(2);
  REQUIRE(lastTwo.size() == 2);
  REQUIRE(lastTwo[0].getEventId() == 4);
}

TEST_CASE("Categorization rules", "[PortMappingTracker]") {
  SECTION("forwarding message is a port trace") {
    auto record = PortMappingTracker::categorize(
        TraceLevel::ERROR, 1, "Forwarding from 127.0.0.1:80 to host port 8080");
    REQUIRE(record.getCategory() == TraceCategory::PORT);
    REQUIRE(record.getPayload()->localPort == uint16_t(80));
    REQUIRE(record.getPayload()->remotePort == uint16_t(8080));
  }

  SECTION("connection keywords carry the state") {
    REQUIRE(PortMappingTracker::categorize(TraceLevel::INFO, 1,
                                           "Tunnel DISCONNECTED by host")
                .getPayload()
                ->state == string("disconnected"));
    REQUIRE(PortMappingTracker::categorize(TraceLevel::INFO, 1,
                                           "Reconnecting to relay")
                .getPayload()
                ->state == string("reconnecting"));
    REQUIRE(PortMappingTracker::categorize(TraceLevel::INFO, 1,
                                           "Connecting to relay")
                .getPayload()
                ->state == string("connecting"));
    auto connected = PortMappingTracker::categorize(TraceLevel::ERROR, 1,
                                                    "Relay connected");
    REQUIRE(connected.getCategory() == TraceCategory::CONNECTION);
    REQUIRE(connected.getPayload()->state == string("connected"));
  }

  SECTION("errors without keywords") {
    auto record = PortMappingTracker::categorize(TraceLevel::ERROR, 1,
                                                 "handshake timed out");
    REQUIRE(record.getCategory() == TraceCategory::ERROR);
    REQUIRE_FALSE(record.getPayload().has_value());
    REQUIRE(PortMappingTracker::categorize(TraceLevel::CRITICAL, 1, "boom")
                .getCategory() == TraceCategory::ERROR);
  }

  SECTION("everything else is generic") {
    auto record =
        PortMappingTracker::categorize(TraceLevel::WARNING, 1, "keepalive");
    REQUIRE(record.getCategory() == TraceCategory::GENERIC);
  }
}

TEST_CASE("Malformed forwarding messages do not match",
          "[PortMappingTracker]") {
  REQUIRE_FALSE(PortMappingTracker::parseForwardingMessage(
      "Forwarding from 127.0.0.1:0 to host port 2222."));
  REQUIRE_FALSE(PortMappingTracker::parseForwardingMessage(
      "Forwarding from 127.0.0.1:70000 to host port 2222."));
  REQUIRE_FALSE(PortMappingTracker::parseForwardingMessage(
      "Forwarding from 127.0.0.1:5000 to host port"));
  REQUIRE_FALSE(PortMappingTracker::parseForwardingMessage(
      "Forwarding from localhost to host port 22"));

  auto withoutPeriod = PortMappingTracker::parseForwardingMessage(
      "Forwarding from 127.0.0.1:5000 to host port 22");
  REQUIRE(withoutPeriod);
  REQUIRE(withoutPeriod->remotePort == 22);

  auto nonAsciiSuffix = PortMappingTracker::parseForwardingMessage(
      "Forwarding from 127.0.0.1:5000 to host port 8080\xc3\xa9");
  REQUIRE(nonAsciiSuffix);
  REQUIRE(nonAsciiSuffix->remotePort == 8080);
  REQUIRE_FALSE(PortMappingTracker::parseForwardingMessage(
      "Forwarding from 127.0.0.1:5000 to host port \xe2\x80\x94"));
}

TEST_CASE("Trace queries and export", "[PortMappingTracker]") {
  auto tracker = makeTracker();
  tracker->recordTrace(TraceLevel::INFO, 1, "Connected");
  tracker->recordTrace(TraceLevel::INFO, 2,
                       "Forwarding from 127.0.0.1:5000 to host port 3000.");
  tracker->recordTrace(TraceLevel::ERROR, 3, "socket reset");
  tracker->recordTrace(TraceLevel::VERBOSE, 4, "ping");

  auto stats = tracker->getTraceStats();
  REQUIRE(stats["total"] == 4);
  REQUIRE(stats["connection"] == 1);
  REQUIRE(stats["port"] == 1);
  REQUIRE(stats["error"] == 1);
  REQUIRE(stats["generic"] == 1);
  REQUIRE(stats["errors"] == 1);

  REQUIRE(tracker->getTracesByCategory(TraceCategory::PORT).size() == 1);

  json exported = json::parse(tracker->exportTraces());
  REQUIRE(exported["traces"].size() == 4);
  REQUIRE(exported["traces"][1]["category"] == "port");
  REQUIRE(exported["traces"][1]["parsedData"]["remotePort"] == 3000);
  REQUIRE(exported["stats"]["total"] == 4);

  tracker->clearTraces();
  REQUIRE(tracker->getTraceCount() == 0);
  REQUIRE(tracker->extractPortMappingsFromTraces().empty());
}
