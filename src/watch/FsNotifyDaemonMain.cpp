#include <cxxopts.hpp>

#include "DaemonConfig.hpp"
#include "FsNotifyErrors.hpp"
#include "LogHandler.hpp"
#include "MonitorRegistry.hpp"
#include "WatchOps.hpp"

using namespace fsn;

namespace {
std::atomic<bool> stopRequested(false);

void requestStop(int) { stopRequested = true; }

void logMessage(const SubscriberMessage& message) {
  if (message.has_event()) {
    CLOG(INFO, "stdout") << message.monitor() << " "
                         << watchOpsToString(
                                decodeWatchOps(message.event().ops()))
                         << " " << message.event().path() << endl;
  } else if (message.has_error()) {
    LOG(WARNING) << message.monitor()
                 << ": watcher error: " << message.error().message();
  } else if (message.has_stop()) {
    LOG(INFO) << "Monitor " << message.stop().name() << " stopped";
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  fsn::HandleTerminate();

  ::signal(SIGINT, requestStop);
  ::signal(SIGTERM, requestStop);
  // Writes to a helper that just died must fail with EPIPE, not kill us.
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("fsnotifyd",
                           "Watches paths through an external helper process");
  int exitCode = 0;
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("name", "Monitor name",
         cxxopts::value<std::string>()->default_value("default"))  //
        ("helper", "Path to the watch helper",
         cxxopts::value<std::string>()->default_value(""))  //
        ("watch", "Path to watch (repeatable)",
         cxxopts::value<std::vector<std::string>>())  //
        ("timeout", "Command timeout in milliseconds",
         cxxopts::value<int>()->default_value("1000"))  //
        ("logtostdout", "log to stdout")                //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(
             GetTempDirectory() + "fsnotifyd"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "fsnotifyd version " << FSN_VERSION << endl;
      exit(0);
    }

    DaemonConfig config;
    if (result.count("cfgfile") &&
        !result["cfgfile"].as<string>().empty()) {
      config = loadDaemonConfig(result["cfgfile"].as<string>());
    }

    // Command line values win over the config file
    MonitorOptions& monitorOptions = config.monitor;
    if (result.count("name")) {
      monitorOptions.set_name(result["name"].as<string>());
    }
    if (result.count("helper")) {
      monitorOptions.set_helper_path(result["helper"].as<string>());
    }
    if (result.count("watch")) {
      monitorOptions.clear_watches();
      for (const auto& path : result["watch"].as<vector<string>>()) {
        monitorOptions.add_watches(path);
      }
    }
    if (result.count("timeout")) {
      int timeoutMs = result["timeout"].as<int>();
      if (timeoutMs <= 0) {
        throw std::runtime_error("--timeout must be positive");
      }
      monitorOptions.set_command_timeout_ms(timeoutMs);
    }
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else {
      el::Loggers::setVerboseLevel(config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    if (monitorOptions.helper_path().empty()) {
      throw std::runtime_error(
          "No helper configured, pass --helper or set [Helper] path");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    // Without --logtostdout the helper's inherited stderr lands in the log
    // directory as well.
    bool logToStdout = result.count("logtostdout") > 0;
    string logFile = LogHandler::setupLogFiles(
        &defaultConf, result["logdir"].as<string>(), "fsnotifyd", logToStdout,
        !logToStdout, config.maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("fsnotifyd-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    CLOG(INFO, "stdout") << "Writing log to " << logFile << endl;

    MonitorRegistry registry;
    auto mailbox = make_shared<Mailbox>(monitorOptions.mailbox_capacity());
    registry.subscribe(monitorOptions.name(), mailbox);
    registry.start(monitorOptions);

    bool running = true;
    while (running && !stopRequested) {
      SubscriberMessage message;
      if (!mailbox->pop(&message, std::chrono::milliseconds(250))) {
        continue;
      }
      logMessage(message);
      if (message.has_stop()) {
        running = false;
        exitCode = 1;
      }
    }
    if (mailbox->droppedCount()) {
      LOG(WARNING) << "Dropped " << mailbox->droppedCount()
                   << " messages while the mailbox was full";
    }
    registry.unsubscribe(monitorOptions.name(), mailbox);
    registry.shutdown();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const MonitorStartError& mse) {
    CLOG(ERROR, "stdout") << mse.what() << endl;
    exitCode = 1;
  } catch (const std::runtime_error& re) {
    CLOG(ERROR, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
