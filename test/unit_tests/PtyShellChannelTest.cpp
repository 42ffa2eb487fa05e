#include "BridgeErrors.hpp"
#include "LogHandler.hpp"
#include "PtyShellChannel.hpp"
#include "TestHeaders.hpp"

using namespace tcode;

TEST_CASE("Shell output flows through the pseudo terminal",
          "[PtyShellChannel]") {
  std::mutex outputMutex;
  string output;
  PtyShellChannel shell({"cat"}, TerminalSize{100, 30}, TRANSPORT_LOGGER);
  shell.setDataCallback([&outputMutex, &output](const string& data) {
    lock_guard<std::mutex> guard(outputMutex);
    output += data;
  });
  shell.start();
  REQUIRE(shell.getPid() > 0);

  shell.write("ping\n");
  bool echoed = false;
  for (int a = 0; a < 200 && !echoed; a++) {
    std::this_thread::sleep_for(chrono::milliseconds(10));
    lock_guard<std::mutex> guard(outputMutex);
    echoed = output.find("ping") != string::npos;
  }
  REQUIRE(echoed);

  TerminalSize size{132, 50};
  REQUIRE_NOTHROW(shell.resize(size));

  shell.close();
  REQUIRE_THROWS_AS(shell.close(), ChannelFault);
  REQUIRE_THROWS_AS(shell.write("late\n"), ChannelFault);
  REQUIRE_THROWS_AS(shell.resize(size), ChannelFault);
}

TEST_CASE("Output before the callback is installed is kept",
          "[PtyShellChannel]") {
  std::mutex outputMutex;
  string output;
  PtyShellChannel shell({"sh", "-c", "echo BANNER; sleep 1"},
                        TerminalSize{80, 24}, TRANSPORT_LOGGER);
  shell.start();
  std::this_thread::sleep_for(chrono::milliseconds(300));

  shell.setDataCallback([&outputMutex, &output](const string& data) {
    lock_guard<std::mutex> guard(outputMutex);
    output += data;
  });
  bool received = false;
  for (int a = 0; a < 200 && !received; a++) {
    {
      lock_guard<std::mutex> guard(outputMutex);
      received = output.find("BANNER") != string::npos;
    }
    if (!received) {
      std::this_thread::sleep_for(chrono::milliseconds(10));
    }
  }
  REQUIRE(received);
  shell.close();
}

TEST_CASE("A shell that exits reports it once", "[PtyShellChannel]") {
  atomic<int> closeCount(0);
  std::mutex reasonMutex;
  string closeReason;
  PtyShellChannel shell({"sh", "-c", "exit 0"}, TerminalSize{80, 24},
                        TRANSPORT_LOGGER);
  shell.setCloseCallback(
      [&closeCount, &reasonMutex, &closeReason](const string& reason) {
        lock_guard<std::mutex> guard(reasonMutex);
        closeReason = reason;
        closeCount++;
      });
  shell.start();
  for (int a = 0; a < 300 && closeCount.load() == 0; a++) {
    std::this_thread::sleep_for(chrono::milliseconds(10));
  }
  REQUIRE(closeCount.load() == 1);
  {
    lock_guard<std::mutex> guard(reasonMutex);
    REQUIRE(closeReason == "Shell process exited");
  }

  // A late subscriber still hears about it
  atomic<int> lateCount(0);
  shell.setCloseCallback([&lateCount](const string&) { lateCount++; });
  REQUIRE(lateCount.load() == 1);

  REQUIRE_NOTHROW(shell.close());
  REQUIRE(closeCount.load() == 1);
}

TEST_CASE("Closing the shell locally is not reported",
          "[PtyShellChannel]") {
  atomic<int> closeCount(0);
  PtyShellChannel shell({"cat"}, TerminalSize{80, 24}, TRANSPORT_LOGGER);
  shell.setCloseCallback([&closeCount](const string&) { closeCount++; });
  shell.start();
  shell.close();
  REQUIRE(closeCount.load() == 0);
}
