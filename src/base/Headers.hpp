#ifndef __TCODE_HEADERS__
#define __TCODE_HEADERS__

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <paths.h>
#include <pthread.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ThreadPool.h"
#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Remote ports with a fixed meaning inside a codespace
const uint16_t CODESPACE_SSH_PORT = 2222;
const uint16_t CODESPACE_ALT_SSH_PORT = 22;
const uint16_t CODESPACE_RPC_PORT = 16634;
const uint16_t CODESPACE_MANAGEMENT_PORT_LAST = 16640;

// Port labels set by the tunnel service
const string USER_FORWARDED_PORT_LABEL = "UserForwardedPort";
const string INTERNAL_PORT_LABEL = "InternalPort";

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef TCODE_VERSION
#define TCODE_VERSION "unknown"
#endif

namespace tcode {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // In case 'to' contains 'from', like replacing
                               // 'x' with 'yx'
  }
  return retval;
}

inline string toLower(string s) {
  transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return (char)tolower(c); });
  return s;
}

/**
 * @brief Formats a time point as ISO-8601 UTC with millisecond precision,
 * e.g. `2024-05-01T12:00:00.123Z`.
 */
inline string toIsoTimestamp(const chrono::system_clock::time_point &tp) {
  auto millis =
      chrono::duration_cast<chrono::milliseconds>(tp.time_since_epoch())
          .count() %
      1000;
  time_t rawtime = chrono::system_clock::to_time_t(tp);
  struct tm timeinfo;
  gmtime_r(&rawtime, &timeinfo);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &timeinfo);
  char result[40];
  snprintf(result, sizeof(result), "%s.%03dZ", buffer, int(millis));
  return string(result);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace tcode

#endif  // __TCODE_HEADERS__
