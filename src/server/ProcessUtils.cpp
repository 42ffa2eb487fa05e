#include "ProcessUtils.hpp"

#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>

namespace tcode {
vector<string> ProcessUtils::expandCommand(const string& commandTemplate,
                                           const map<string, string>& values) {
  vector<string> argv;
  for (auto word : split(commandTemplate, ' ')) {
    if (word.empty()) {
      continue;
    }
    for (const auto& it : values) {
      replaceAll(word, "{" + it.first + "}", it.second);
    }
    argv.push_back(word);
  }
  return argv;
}

pid_t ProcessUtils::spawnWithOutputPipe(const vector<string>& argv,
                                        int* outputFd) {
  if (argv.empty()) {
    throw std::runtime_error("Empty command line");
  }
  int link[2];
  if (::pipe(link) == -1) {
    throw std::runtime_error(string("pipe() failed: ") + strerror(GetErrno()));
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link[1], STDOUT_FILENO);
    dup2(link[1], STDERR_FILENO);
    close(link[0]);
    close(link[1]);
    signal(SIGCHLD, SIG_DFL);
    execOrExit(argv);
  }
  if (pid < 0) {
    auto localErrno = GetErrno();
    close(link[0]);
    close(link[1]);
    throw std::runtime_error(string("fork() failed: ") + strerror(localErrno));
  }
  // parent process
  close(link[1]);
  *outputFd = link[0];
  return pid;
}

void ProcessUtils::execOrExit(const vector<string>& argv) {
  char** argsArray = new char*[argv.size() + 1];
  for (size_t a = 0; a < argv.size(); a++) {
    argsArray[a] = strdup(argv[a].c_str());
  }
  argsArray[argv.size()] = NULL;
  execvp(argsArray[0], argsArray);

  fprintf(stderr, "error: cannot execute %s: %s\n", argv[0].c_str(),
          strerror(GetErrno()));
  for (size_t a = 0; a < argv.size(); a++) {
    free(argsArray[a]);
  }
  delete[] argsArray;
  _exit(127);
}

void ProcessUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      throw std::runtime_error(string("Cannot write: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write: descriptor closed");
    }
    bytesWritten += rc;
  }
}

bool ProcessUtils::waitForData(int fd, chrono::milliseconds timeout) {
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(fd, &readfds);
  timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;
  int rc = ::select(fd + 1, &readfds, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw std::runtime_error(string("select() failed: ") +
                             strerror(GetErrno()));
  }
  return rc > 0;
}

void ProcessUtils::terminate(pid_t pid, chrono::milliseconds timeout) {
  if (pid <= 0) {
    return;
  }
  ::kill(pid, SIGTERM);
  auto deadline = chrono::steady_clock::now() + timeout;
  while (true) {
    int status;
    pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid || (rc < 0 && GetErrno() == ECHILD)) {
      return;
    }
    if (chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(chrono::milliseconds(20));
  }
  LOG(WARNING) << "Process " << pid << " ignored SIGTERM, killing it";
  ::kill(pid, SIGKILL);
  int status;
  ::waitpid(pid, &status, 0);
}

bool ProcessUtils::isLocalPortOpen(uint16_t port) {
  int sockFd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (sockFd < 0) {
    return false;
  }
  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  bool open =
      ::connect(sockFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  ::close(sockFd);
  return open;
}
}  // namespace tcode
