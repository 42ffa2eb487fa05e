#ifndef __TCODE_PTY_SHELL_CHANNEL__
#define __TCODE_PTY_SHELL_CHANNEL__

#include "Headers.hpp"
#include "RelayTransport.hpp"

namespace tcode {
/**
 * @brief Shell channel backed by an ssh client running under a pseudo
 * terminal.
 */
class PtyShellChannel : public SecureShellChannel {
 public:
  PtyShellChannel(const vector<string>& _command, const TerminalSize& _size,
                  const string& _loggerId);
  virtual ~PtyShellChannel();

  /**
   * @brief Forks the ssh client and starts reading its output.
   * @throws BridgeError if the pseudo terminal cannot be created.
   */
  void start();

  virtual void setDataCallback(std::function<void(const string&)> callback);
  virtual void setCloseCallback(
      std::function<void(const string& reason)> callback);
  virtual void write(const string& data);
  virtual void resize(const TerminalSize& size);
  virtual void close();

  pid_t getPid() { return pid; }

 protected:
  void readLoop();
  void deliverOutput(const string& data);
  void notifyEnded(const string& reason);
  void shutdown();

  vector<string> command;
  TerminalSize initialSize;
  string loggerId;

  pid_t pid;
  int masterFd;
  std::thread readerThread;
  atomic<bool> closed;

  std::mutex callbackMutex;
  std::function<void(const string&)> dataCallback;
  std::function<void(const string&)> closeCallback;
  // Output read before a data callback was installed
  string pendingOutput;
  optional<string> endedReason;
};
}  // namespace tcode

#endif  // __TCODE_PTY_SHELL_CHANNEL__
