#include "PortMappingTracker.hpp"

namespace tcode {
namespace {
const string FORWARDING_PREFIX = "Forwarding from ";
const string FORWARDING_HOST_PORT = " to host port ";

optional<uint16_t> parsePort(const string& digits) {
  if (digits.empty() || digits.length() > 5 ||
      digits.find_first_not_of("0123456789") != string::npos) {
    return nullopt;
  }
  int value = stoi(digits);
  if (value < 1 || value > 65535) {
    return nullopt;
  }
  return uint16_t(value);
}

// Order matters: "disconnected" and "reconnecting" contain "connect".
optional<string> parseConnectionState(const string& message) {
  string lower = toLower(message);
  if (lower.find("disconnect") != string::npos) {
    return string("disconnected");
  }
  if (lower.find("reconnecting") != string::npos) {
    return string("reconnecting");
  }
  if (lower.find("connecting") != string::npos) {
    return string("connecting");
  }
  if (lower.find("connected") != string::npos) {
    return string("connected");
  }
  return nullopt;
}
}  // namespace

string traceCategoryToString(TraceCategory category) {
  switch (category) {
    case TraceCategory::CONNECTION:
      return "connection";
    case TraceCategory::PORT:
      return "port";
    case TraceCategory::ERROR:
      return "error";
    case TraceCategory::GENERIC:
      return "generic";
  }
  return "generic";
}

json TraceRecord::toJson() const {
  json record;
  record["timestamp"] = toIsoTimestamp(timestamp);
  record["level"] = traceLevelToString(level);
  record["eventId"] = eventId;
  record["message"] = message;
  record["category"] = traceCategoryToString(category);
  if (payload) {
    json parsed = json::object();
    if (payload->state) parsed["state"] = *payload->state;
    if (payload->localPort) parsed["localPort"] = *payload->localPort;
    if (payload->remotePort) parsed["remotePort"] = *payload->remotePort;
    if (payload->protocol) parsed["protocol"] = *payload->protocol;
    record["parsedData"] = parsed;
  }
  return record;
}

/**
 * @brief Sink installed in front of a transport's original sink. Forwards to
 * the original first, then feeds the tracker if it is still alive.
 */
class InterceptingTraceSink : public TraceSink {
 public:
  InterceptingTraceSink(shared_ptr<TraceSink> _original,
                        weak_ptr<PortMappingTracker> _tracker)
      : original(std::move(_original)), tracker(std::move(_tracker)) {}

  void trace(TraceLevel level, int eventId, const string& message) override {
    if (original) {
      original->trace(level, eventId, message);
    }
    auto t = tracker.lock();
    if (t) {
      t->recordTrace(level, eventId, message);
    }
  }

 protected:
  shared_ptr<TraceSink> original;
  weak_ptr<PortMappingTracker> tracker;
};

PortMappingTracker::PortMappingTracker(size_t _maxTraceHistory,
                                       bool _debugTrace,
                                       const string& _loggerId)
    : maxTraceHistory(std::max<size_t>(1, _maxTraceHistory)),
      debugTrace(_debugTrace),
      loggerId(_loggerId) {
  el::Loggers::getLogger(loggerId);
}

PortMappingTracker::~PortMappingTracker() { detachFromAllClients(); }

shared_ptr<TraceSubscription> PortMappingTracker::subscribe(
    shared_ptr<RelayTransport> transport) {
  lock_guard<std::mutex> guard(subscriptionMutex);
  auto it = attachedClients.find(transport.get());
  if (it != attachedClients.end() && it->second->active) {
    CLOG(WARNING, loggerId.c_str())
        << "Trace listener already attached to this transport";
    return it->second;
  }

  auto subscription = make_shared<TraceSubscription>();
  subscription->transport = transport;
  subscription->originalSink = transport->getTraceSink();
  subscription->interceptor = make_shared<InterceptingTraceSink>(
      subscription->originalSink, weak_from_this());
  transport->setTraceSink(subscription->interceptor);
  attachedClients[transport.get()] = subscription;
  CLOG(INFO, loggerId.c_str()) << "Trace listener attached to transport";
  return subscription;
}

void PortMappingTracker::unsubscribe(
    shared_ptr<TraceSubscription> subscription) {
  if (!subscription) {
    return;
  }
  lock_guard<std::mutex> guard(subscriptionMutex);
  if (!subscription->active) {
    return;
  }
  subscription->transport->setTraceSink(subscription->originalSink);
  subscription->active = false;
  auto it = attachedClients.find(subscription->transport.get());
  if (it != attachedClients.end() && it->second == subscription) {
    attachedClients.erase(it);
  }
  CLOG(INFO, loggerId.c_str()) << "Trace listener detached from transport";
  subscription->interceptor.reset();
  subscription->transport.reset();
}

void PortMappingTracker::attachToClient(shared_ptr<RelayTransport> transport) {
  subscribe(transport);
}

void PortMappingTracker::detachFromClient(
    shared_ptr<RelayTransport> transport) {
  shared_ptr<TraceSubscription> subscription;
  {
    lock_guard<std::mutex> guard(subscriptionMutex);
    auto it = attachedClients.find(transport.get());
    if (it == attachedClients.end()) {
      CLOG(WARNING, loggerId.c_str())
          << "Trace listener not attached to this transport";
      return;
    }
    subscription = it->second;
  }
  unsubscribe(subscription);
}

void PortMappingTracker::detachFromAllClients() {
  vector<shared_ptr<TraceSubscription>> subscriptions;
  {
    lock_guard<std::mutex> guard(subscriptionMutex);
    for (auto& it : attachedClients) {
      subscriptions.push_back(it.second);
    }
  }
  for (auto& subscription : subscriptions) {
    unsubscribe(subscription);
  }
}

bool PortMappingTracker::isAttachedTo(shared_ptr<RelayTransport> transport) {
  lock_guard<std::mutex> guard(subscriptionMutex);
  return attachedClients.find(transport.get()) != attachedClients.end();
}

void PortMappingTracker::recordTrace(TraceLevel level, int eventId,
                                     const string& message) {
  TraceRecord record = categorize(level, eventId, message);
  if (debugTrace && record.getCategory() != TraceCategory::GENERIC) {
    CLOG(INFO, loggerId.c_str())
        << "[" << traceCategoryToString(record.getCategory()) << "] "
        << message;
  }
  lock_guard<std::mutex> guard(traceMutex);
  traces.push_back(std::move(record));
  while (traces.size() > maxTraceHistory) {
    traces.pop_front();
  }
}

optional<PortMapping> PortMappingTracker::parseForwardingMessage(
    const string& message) {
  size_t prefixPos = message.find(FORWARDING_PREFIX);
  if (prefixPos == string::npos) {
    return nullopt;
  }
  size_t hostStart = prefixPos + FORWARDING_PREFIX.length();
  size_t hostPortEnd = message.find(FORWARDING_HOST_PORT, hostStart);
  if (hostPortEnd == string::npos) {
    return nullopt;
  }
  string hostAndPort = message.substr(hostStart, hostPortEnd - hostStart);
  size_t lastColon = hostAndPort.rfind(':');
  if (lastColon == string::npos || lastColon == 0) {
    return nullopt;
  }
  string host = hostAndPort.substr(0, lastColon);
  auto localPort = parsePort(hostAndPort.substr(lastColon + 1));

  size_t remoteStart = hostPortEnd + FORWARDING_HOST_PORT.length();
  size_t remoteEnd = remoteStart;
  while (remoteEnd < message.length() &&
         isdigit((unsigned char)message[remoteEnd])) {
    remoteEnd++;
  }
  auto remotePort =
      parsePort(message.substr(remoteStart, remoteEnd - remoteStart));
  if (!localPort || !remotePort) {
    return nullopt;
  }

  PortMapping mapping;
  mapping.localPort = *localPort;
  mapping.remotePort = *remotePort;
  if (host.find(':') != string::npos) {
    mapping.protocol = string("ipv6");
  }
  mapping.isActive = true;
  mapping.provenance = PortProvenance::TRACE_FALLBACK;
  return mapping;
}

TraceRecord PortMappingTracker::categorize(TraceLevel level, int eventId,
                                           const string& message) {
  auto now = chrono::system_clock::now();

  auto forwarding = parseForwardingMessage(message);
  if (forwarding) {
    TracePayload payload;
    payload.localPort = forwarding->localPort;
    payload.remotePort = forwarding->remotePort;
    payload.protocol = forwarding->protocol;
    return TraceRecord(now, level, eventId, message, TraceCategory::PORT,
                       payload);
  }

  auto state = parseConnectionState(message);
  if (state) {
    TracePayload payload;
    payload.state = state;
    return TraceRecord(now, level, eventId, message,
                       TraceCategory::CONNECTION, payload);
  }

  if (level >= TraceLevel::ERROR) {
    return TraceRecord(now, level, eventId, message, TraceCategory::ERROR,
                       nullopt);
  }

  return TraceRecord(now, level, eventId, message, TraceCategory::GENERIC,
                     nullopt);
}

vector<PortMapping> PortMappingTracker::extractPortMappingsFromTraces() {
  vector<PortMapping> mappings;
  lock_guard<std::mutex> guard(traceMutex);
  for (const auto& record : traces) {
    if (record.getCategory() != TraceCategory::PORT || !record.getPayload()) {
      continue;
    }
    const auto& payload = *record.getPayload();
    PortMapping mapping;
    mapping.localPort = payload.localPort.value_or(0);
    mapping.remotePort = payload.remotePort.value_or(0);
    mapping.protocol = payload.protocol;
    mapping.isActive = true;
    mapping.provenance = PortProvenance::TRACE_FALLBACK;
    mappings.push_back(mapping);
  }
  return mappings;
}

vector<TraceRecord> PortMappingTracker::getTracesByCategory(
    TraceCategory category) {
  vector<TraceRecord> retval;
  lock_guard<std::mutex> guard(traceMutex);
  for (const auto& record : traces) {
    if (record.getCategory() == category) {
      retval.push_back(record);
    }
  }
  return retval;
}

vector<TraceRecord> PortMappingTracker::getRecentTraces(size_t count) {
  lock_guard<std::mutex> guard(traceMutex);
  size_t start = traces.size() > count ? traces.size() - count : 0;
  return vector<TraceRecord>(traces.begin() + start, traces.end());
}

map<string, int> PortMappingTracker::getTraceStats() {
  lock_guard<std::mutex> guard(traceMutex);
  return getTraceStatsLocked();
}

map<string, int> PortMappingTracker::getTraceStatsLocked() {
  map<string, int> stats = {{"total", int(traces.size())},
                            {"connection", 0},
                            {"port", 0},
                            {"error", 0},
                            {"generic", 0},
                            {"errors", 0}};
  for (const auto& record : traces) {
    stats[traceCategoryToString(record.getCategory())]++;
    if (record.getLevel() >= TraceLevel::ERROR) {
      stats["errors"]++;
    }
  }
  return stats;
}

string PortMappingTracker::exportTraces() {
  json dump;
  dump["exported"] = toIsoTimestamp(chrono::system_clock::now());
  dump["maxTraceHistory"] = maxTraceHistory;
  lock_guard<std::mutex> guard(traceMutex);
  dump["stats"] = getTraceStatsLocked();
  json records = json::array();
  for (const auto& record : traces) {
    records.push_back(record.toJson());
  }
  dump["traces"] = records;
  return dump.dump(2);
}

void PortMappingTracker::clearTraces() {
  {
    lock_guard<std::mutex> guard(traceMutex);
    traces.clear();
  }
  CVLOG(1, loggerId.c_str()) << "Trace history cleared";
}

size_t PortMappingTracker::getTraceCount() {
  lock_guard<std::mutex> guard(traceMutex);
  return traces.size();
}
}  // namespace tcode
