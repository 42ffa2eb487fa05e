#ifndef __TCODE_PORT_MAPPING_TRACKER__
#define __TCODE_PORT_MAPPING_TRACKER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PortTypes.hpp"
#include "RelayTransport.hpp"
#include "TraceSink.hpp"

namespace tcode {
enum class TraceCategory {
  CONNECTION,
  PORT,
  ERROR,
  GENERIC,
};

string traceCategoryToString(TraceCategory category);

/** @brief Structured data pulled out of a trace message. */
struct TracePayload {
  optional<string> state;
  optional<uint16_t> localPort;
  optional<uint16_t> remotePort;
  optional<string> protocol;
};

/** @brief One categorized trace event. Immutable once built. */
class TraceRecord {
 public:
  TraceRecord(chrono::system_clock::time_point _timestamp, TraceLevel _level,
              int _eventId, const string& _message, TraceCategory _category,
              optional<TracePayload> _payload)
      : timestamp(_timestamp),
        level(_level),
        eventId(_eventId),
        message(_message),
        category(_category),
        payload(std::move(_payload)) {}

  chrono::system_clock::time_point getTimestamp() const { return timestamp; }
  TraceLevel getLevel() const { return level; }
  int getEventId() const { return eventId; }
  const string& getMessage() const { return message; }
  TraceCategory getCategory() const { return category; }
  const optional<TracePayload>& getPayload() const { return payload; }

  json toJson() const;

 protected:
  chrono::system_clock::time_point timestamp;
  TraceLevel level;
  int eventId;
  string message;
  TraceCategory category;
  optional<TracePayload> payload;
};

class InterceptingTraceSink;

/**
 * @brief Handle for one interception of a transport's trace sink. Hold it to
 * keep the interception alive and hand it back to `unsubscribe`.
 */
class TraceSubscription {
 public:
  /** @brief The sink that was installed before this subscription. */
  shared_ptr<TraceSink> getOriginalSink() const { return originalSink; }
  bool isActive() const { return active; }

 protected:
  friend class PortMappingTracker;

  shared_ptr<RelayTransport> transport;
  shared_ptr<TraceSink> originalSink;
  shared_ptr<InterceptingTraceSink> interceptor;
  bool active = true;
};

/**
 * @brief Listens to a relay transport's trace events and derives port
 * forwarding facts from them.
 *
 * Keeps a bounded, oldest-first-evicted history of categorized traces. The
 * tracker must be owned by a shared_ptr: installed interceptors only hold a
 * weak reference back to it.
 */
class PortMappingTracker
    : public std::enable_shared_from_this<PortMappingTracker> {
 public:
  PortMappingTracker(size_t _maxTraceHistory, bool _debugTrace,
                     const string& _loggerId);
  virtual ~PortMappingTracker();

  /**
   * @brief Wraps the transport's current trace sink with an interceptor.
   * @return The subscription; subscribing twice to the same transport returns
   * the live subscription instead of stacking a second interceptor.
   */
  shared_ptr<TraceSubscription> subscribe(
      shared_ptr<RelayTransport> transport);
  /**
   * @brief Puts back the sink captured by `subscription`. A no-op for a
   * subscription that is no longer active.
   */
  void unsubscribe(shared_ptr<TraceSubscription> subscription);

  /** @brief Subscribes and remembers the subscription for `transport`. */
  void attachToClient(shared_ptr<RelayTransport> transport);
  /**
   * @brief Restores the sink captured at the most recent attach, so the
   * transport's sink is pointer-equal to its pre-attach value.
   */
  void detachFromClient(shared_ptr<RelayTransport> transport);
  void detachFromAllClients();
  bool isAttachedTo(shared_ptr<RelayTransport> transport);

  /** @brief Categorizes and stores one trace event. */
  void recordTrace(TraceLevel level, int eventId, const string& message);

  /**
   * @brief One mapping per retained port trace, oldest first, without
   * de-duplication.
   */
  vector<PortMapping> extractPortMappingsFromTraces();

  vector<TraceRecord> getTracesByCategory(TraceCategory category);
  vector<TraceRecord> getRecentTraces(size_t count = 50);
  map<string, int> getTraceStats();
  string exportTraces();
  void clearTraces();
  size_t getTraceCount();
  size_t getMaxTraceHistory() const { return maxTraceHistory; }

  /** @brief Applies the categorization rules to a single message. */
  static TraceRecord categorize(TraceLevel level, int eventId,
                                const string& message);
  /**
   * @brief Parses `Forwarding from <host>:<port> to host port <port>.`
   * @return nullopt when the message does not have that shape.
   */
  static optional<PortMapping> parseForwardingMessage(const string& message);

 protected:
  map<string, int> getTraceStatsLocked();

  size_t maxTraceHistory;
  bool debugTrace;
  string loggerId;

  std::mutex traceMutex;
  deque<TraceRecord> traces;

  std::mutex subscriptionMutex;
  map<RelayTransport*, shared_ptr<TraceSubscription>> attachedClients;
};
}  // namespace tcode

#endif  // __TCODE_PORT_MAPPING_TRACKER__
