#ifndef __TCODE_PROCESS_UTILS__
#define __TCODE_PROCESS_UTILS__

#include "Headers.hpp"

namespace tcode {
/**
 * @brief Helpers for the child processes the bridge runs: the tunnel
 * forwarder and the ssh client.
 */
class ProcessUtils {
 public:
  /**
   * @brief Splits a command template on spaces and replaces every
   * `{name}` placeholder inside the resulting words.
   */
  static vector<string> expandCommand(const string& commandTemplate,
                                      const map<string, string>& values);

  /**
   * @brief Starts `argv` with stdout and stderr connected to a pipe.
   * @param outputFd Receives the read end of the pipe.
   * @throws std::runtime_error if the pipe or the fork fails.
   */
  static pid_t spawnWithOutputPipe(const vector<string>& argv, int* outputFd);

  /**
   * @brief Replaces the current (child) process image. Only returns by
   * exiting.
   */
  [[noreturn]] static void execOrExit(const vector<string>& argv);

  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /** @brief Waits up to `timeout` for `fd` to become readable. */
  static bool waitForData(int fd, chrono::milliseconds timeout);

  /**
   * @brief Sends SIGTERM, escalates to SIGKILL if the process is still
   * alive after `timeout`, and reaps it.
   */
  static void terminate(pid_t pid, chrono::milliseconds timeout);

  /** @brief True if something accepts TCP connections on localhost:port. */
  static bool isLocalPortOpen(uint16_t port);
};
}  // namespace tcode

#endif  // __TCODE_PROCESS_UTILS__
