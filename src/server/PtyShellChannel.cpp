#include "PtyShellChannel.hpp"

#include "BridgeErrors.hpp"
#include "ProcessUtils.hpp"

namespace tcode {
namespace {
const size_t MAX_PENDING_OUTPUT = 1024 * 1024;
}

PtyShellChannel::PtyShellChannel(const vector<string>& _command,
                                 const TerminalSize& _size,
                                 const string& _loggerId)
    : command(_command),
      initialSize(_size),
      loggerId(_loggerId),
      pid(-1),
      masterFd(-1),
      closed(false) {}

PtyShellChannel::~PtyShellChannel() { shutdown(); }

void PtyShellChannel::start() {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = initialSize.cols;
  win.ws_row = initialSize.rows;

  pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1:
      throw BridgeError(string("Cannot create pseudo terminal: ") +
                        strerror(GetErrno()));
    case 0: {
      // child
      signal(SIGCHLD, SIG_DFL);
      setenv("TERM", "xterm-256color", 1);
      ProcessUtils::execOrExit(command);
    }
    default: {
      // parent
      break;
    }
  }
  CLOG(INFO, loggerId.c_str())
      << "Started shell process " << pid << ": " << command[0];
  readerThread = std::thread(&PtyShellChannel::readLoop, this);
}

void PtyShellChannel::setDataCallback(
    std::function<void(const string&)> callback) {
  lock_guard<std::mutex> guard(callbackMutex);
  dataCallback = callback;
  if (dataCallback && !pendingOutput.empty()) {
    string buffered;
    buffered.swap(pendingOutput);
    dataCallback(buffered);
  }
}

void PtyShellChannel::setCloseCallback(
    std::function<void(const string& reason)> callback) {
  string reason;
  {
    lock_guard<std::mutex> guard(callbackMutex);
    if (!endedReason) {
      closeCallback = callback;
      return;
    }
    reason = *endedReason;
  }
  if (callback) {
    callback(reason);
  }
}

void PtyShellChannel::write(const string& data) {
  if (closed) {
    throw ChannelFault("Shell is closed");
  }
  try {
    ProcessUtils::writeAll(masterFd, data.c_str(), data.length());
  } catch (const std::runtime_error& re) {
    throw ChannelFault(re.what());
  }
}

void PtyShellChannel::resize(const TerminalSize& size) {
  if (closed) {
    throw ChannelFault("Shell is closed");
  }
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = size.cols;
  win.ws_row = size.rows;
  if (ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    throw ChannelFault(string("Cannot resize shell: ") + strerror(GetErrno()));
  }
}

void PtyShellChannel::close() {
  if (closed) {
    throw ChannelFault("Shell already closed");
  }
  shutdown();
}

void PtyShellChannel::readLoop() {
  el::Helpers::setThreadName("pty-reader");
  char buf[4096];
  string reason;
  while (!closed) {
    try {
      if (!ProcessUtils::waitForData(masterFd, chrono::milliseconds(100))) {
        continue;
      }
    } catch (const std::runtime_error& re) {
      CLOG(ERROR, loggerId.c_str()) << "Shell read failed: " << re.what();
      reason = re.what();
      break;
    }
    int rc = ::read(masterFd, buf, sizeof(buf));
    if (rc < 0 && (GetErrno() == EAGAIN || GetErrno() == EINTR)) {
      continue;
    }
    if (rc <= 0) {
      // EIO once the child hangs up
      CLOG(INFO, loggerId.c_str()) << "Shell process " << pid << " ended";
      reason = "Shell process exited";
      break;
    }
    deliverOutput(string(buf, rc));
  }
  if (!closed) {
    notifyEnded(reason);
  }
}

void PtyShellChannel::deliverOutput(const string& data) {
  // Delivered under the lock so buffered output is never overtaken
  lock_guard<std::mutex> guard(callbackMutex);
  if (dataCallback) {
    dataCallback(data);
    return;
  }
  pendingOutput.append(data);
  if (pendingOutput.length() > MAX_PENDING_OUTPUT) {
    pendingOutput.erase(0, pendingOutput.length() - MAX_PENDING_OUTPUT);
  }
}

void PtyShellChannel::notifyEnded(const string& reason) {
  std::function<void(const string&)> callback;
  {
    lock_guard<std::mutex> guard(callbackMutex);
    endedReason = reason;
    callback = closeCallback;
    closeCallback = nullptr;
  }
  if (callback) {
    callback(reason);
  }
}

void PtyShellChannel::shutdown() {
  if (closed.exchange(true)) {
    return;
  }
  if (pid > 0) {
    ProcessUtils::terminate(pid, chrono::milliseconds(1000));
  }
  if (readerThread.joinable()) {
    if (readerThread.get_id() == std::this_thread::get_id()) {
      readerThread.detach();
    } else {
      readerThread.join();
    }
  }
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}
}  // namespace tcode
