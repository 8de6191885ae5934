#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "LoginHttpServer.hpp"
#include "ServerConfig.hpp"

using namespace cpa;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  cpa::HandleTerminate();

  // SIGINT and SIGTERM are handled by a sigwait() thread so that running
  // logins get cancelled. Blocked before any thread exists.
  sigset_t stopSignals;
  sigemptyset(&stopSignals);
  sigaddset(&stopSignals, SIGINT);
  sigaddset(&stopSignals, SIGTERM);
  int rc = pthread_sigmask(SIG_BLOCK, &stopSignals, NULL);
  if (rc != 0) {
    STFATAL << "Cannot block stop signals: " << strerror(rc);
  }
  // A login child closing its pty must not kill the server
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("cpadash-login-server",
                           "Runs the proxy's OAuth logins for the dashboard");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("servicedir", "Directory containing the proxy binary",
         cxxopts::value<std::string>())  //
        ("binary", "File name of the proxy binary",
         cxxopts::value<std::string>())  //
        ("bindip", "IP to listen on", cxxopts::value<std::string>())  //
        ("port", "Port to listen on", cxxopts::value<int>())           //
        ("maxsessionseconds", "Cancel logins older than this",
         cxxopts::value<int>())                //
        ("logtostdout", "log to stdout")        //
        ("logdir", "Base directory for log files.",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "cpadash-login-server version " << CPA_VERSION
                           << endl;
      exit(0);
    }

    ServerConfig config = ServerConfig::fromEnvironment();
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        config.loadIniFile(cfgfilename);
      } catch (const std::exception& e) {
        STFATAL << "Invalid config file: " << cfgfilename << ": " << e.what();
      }
    }

    if (result.count("servicedir")) {
      config.serviceDir = result["servicedir"].as<string>();
    }
    if (result.count("binary")) {
      config.binaryName = result["binary"].as<string>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("maxsessionseconds")) {
      config.maxSessionSeconds = result["maxsessionseconds"].as<int>();
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    // prioritize command line option over cfgfile
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);

    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    if (config.serviceDir.empty()) {
      config.serviceDir = fs::current_path().string();
    }

    string logFile = LogHandler::setupLogFiles(
        &defaultConf, config.logDirectory, "cpadash-login",
        result.count("logtostdout") > 0, !result.count("logtostdout"), true,
        config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("login-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    LOG(INFO) << "Logging to " << logFile;
    LOG(INFO) << "Proxy binary: " << config.binaryPath();
    if (!fs::exists(config.binaryPath())) {
      LOG(WARNING) << "Proxy binary does not exist yet, logins will fail "
                      "until it is installed";
    }

    shared_ptr<LoginSupervisor> supervisor(new LoginSupervisor());
    LoginHttpServer server(supervisor, config);
    std::thread signalThread([&server, stopSignals]() {
      el::Helpers::setThreadName("signal-waiter");
      int signum = 0;
      if (sigwait(&stopSignals, &signum) == 0) {
        LOG(INFO) << "Got signal " << signum << ", shutting down";
      }
      server.shutdown();
    });
    string runError;
    try {
      server.run();
    } catch (const std::runtime_error& re) {
      runError = re.what();
    }
    // Wake the waiter if listen() returned on its own.
    ::kill(::getpid(), SIGTERM);
    signalThread.join();
    if (!runError.empty()) {
      throw std::runtime_error(runError);
    }
    LOG(INFO) << "Login server stopped";
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::exception& e) {
    CLOG(INFO, "stdout") << "Error: " << e.what() << endl;
    LOG(ERROR) << e.what();
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
