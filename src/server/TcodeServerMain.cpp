#include <cxxopts.hpp>

#include "BridgeConfig.hpp"
#include "DefaultCodespaceBackend.hpp"
#include "LogHandler.hpp"
#include "ProtocolRouter.hpp"
#include "WebSocketServer.hpp"

using namespace tcode;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tcode::HandleTerminate();

  // A browser that goes away mid-write must not kill the server
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tcode-server",
                           "Browser terminal bridge to GitHub Codespaces");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("workers", "Worker threads for codespace operations",
         cxxopts::value<int>()->default_value("0"))  //
        ("debugtrace", "Log every categorized tunnel trace")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tcode-server version " << TCODE_VERSION << endl;
      exit(0);
    }

    BridgeConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        config.applyIniFile(cfgfilename);
      } catch (const std::runtime_error &re) {
        STFATAL << re.what();
      }
    }
    config.applyEnvironment();

    if (result.count("port") && result["port"].as<int>() > 0) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip") && !result["bindip"].as<string>().empty()) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("workers") && result["workers"].as<int>() > 0) {
      config.workerThreads = result["workers"].as<int>();
    }
    if (result.count("logdir") && !result["logdir"].as<string>().empty()) {
      config.logDirectory = result["logdir"].as<string>();
    }
    if (result.count("debugtrace")) {
      config.debugTrace = true;
    }
    if (result.count("verbose") && result["verbose"].as<int>() > 0) {
      config.verbose = result["verbose"].as<int>();
    }
    if (config.workerThreads <= 0) {
      config.workerThreads = 4;
    }
    el::Loggers::setVerboseLevel(config.verbose);

    string logDirectory = config.logDirectory.empty()
                              ? GetTempDirectory() + "tcode"
                              : config.logDirectory;
    bool logToStdout = result.count("logtostdout") > 0;
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "tcode-server",
                              logToStdout, !logToStdout, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setupComponentLoggers(defaultConf);
    // set thread name
    el::Helpers::setThreadName("tcode-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    LOG(INFO) << "Starting tcode-server " << TCODE_VERSION << " with "
              << config.workerThreads << " workers, grace period "
              << config.gracePeriod.count() << "ms";

    net::io_context ioContext;
    auto workerPool = make_shared<ThreadPool>(config.workerThreads);
    auto backend = make_shared<DefaultCodespaceBackend>(config);
    auto router = make_shared<ProtocolRouter>(backend, config, workerPool);
    WebSocketServer server(ioContext, config.bindIp, config.port, router);

    net::signal_set signals(ioContext, SIGINT, SIGTERM);
    signals.async_wait([&](const beast::error_code &ec, int signum) {
      if (ec) {
        return;
      }
      LOG(INFO) << "Got signal " << signum << ", shutting down";
      CLOG(INFO, "stdout") << endl << "Shutting down." << endl;
      server.stop();
      ioContext.stop();
    });

    server.start();
    CLOG(INFO, "stdout") << "tcode-server listening on " << config.bindIp
                         << ":" << server.getPort() << endl;
    ioContext.run();

    // Dispose every session and RPC facility before the pool goes away
    router->shutdown();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
