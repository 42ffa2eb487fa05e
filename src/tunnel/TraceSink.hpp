#ifndef __TCODE_TRACE_SINK__
#define __TCODE_TRACE_SINK__

#include "Headers.hpp"

namespace tcode {
/** @brief Severity attached to a transport trace event. */
enum class TraceLevel {
  VERBOSE = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4,
};

inline string traceLevelToString(TraceLevel level) {
  switch (level) {
    case TraceLevel::VERBOSE:
      return "verbose";
    case TraceLevel::INFO:
      return "info";
    case TraceLevel::WARNING:
      return "warning";
    case TraceLevel::ERROR:
      return "error";
    case TraceLevel::CRITICAL:
      return "critical";
  }
  return "unknown";
}

/**
 * @brief Receives trace events from a relay transport.
 *
 * Invoked synchronously on the transport's own thread; implementations must
 * not block.
 */
class TraceSink {
 public:
  virtual ~TraceSink() {}

  virtual void trace(TraceLevel level, int eventId, const string& message) = 0;
};

/** @brief Adapts a callable into a `TraceSink`. */
class FunctionTraceSink : public TraceSink {
 public:
  explicit FunctionTraceSink(
      std::function<void(TraceLevel, int, const string&)> _fn)
      : fn(std::move(_fn)) {}

  void trace(TraceLevel level, int eventId, const string& message) override {
    if (fn) {
      fn(level, eventId, message);
    }
  }

 protected:
  std::function<void(TraceLevel, int, const string&)> fn;
};
}  // namespace tcode

#endif  // __TCODE_TRACE_SINK__
