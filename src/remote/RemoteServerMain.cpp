#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PvConfig.hpp"
#include "RemoteTerminalServer.hpp"

using namespace pv;

namespace {
volatile sig_atomic_t serverTerminateFlag = 0;

void requestTerminate(int signum) { serverTerminateFlag = 1; }
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  pv::HandleTerminate();

  ::signal(SIGTERM, requestTerminate);
  ::signal(SIGINT, requestTerminate);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("pvserver", "Remote terminal server");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port for /terminal, /health and /terminals",
         cxxopts::value<int>())  //
        ("bindip", "IP to listen on", cxxopts::value<string>())  //
        ("logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "pvserver version " << PV_VERSION << endl;
      exit(0);
    }

    string cfgfile = result["cfgfile"].as<string>();
    PvConfig config =
        PvConfig::load(cfgfile.empty() ? PvConfig::defaultPath() : cfgfile);

    // Command line flags override the config file
    if (result.count("port")) {
      config.server.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.server.bindIp = result["bindip"].as<string>();
    }

    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else {
      el::Loggers::setVerboseLevel(config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    string logDirectory = result["logdir"].as<string>();
    if (logDirectory.empty()) {
      logDirectory = GetTempDirectory() + "ptyvisor";
    }
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "pvserver",
                              result.count("logtostdout") > 0,
                              !result.count("logtostdout"), false,
                              config.maxLogSize);
    LogHandler::activate(defaultConf, "pvserver-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (-1 == sodium_init()) {
      STFATAL << "libsodium init failed";
    }

    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
    shared_ptr<BackendDetector> detector(new BackendDetector(
        shared_ptr<PlatformProbe>(new SystemPlatformProbe(subprocessUtils))));
    shared_ptr<TerminalFactory> terminalFactory(new TerminalFactory(detector));

    RemoteTerminalServer server(terminalFactory, config.server.bindIp,
                                config.server.port);
    server.start();
    CLOG(INFO, "stdout") << "pvserver listening on port " << server.getPort()
                         << endl;
    while (!serverTerminateFlag) {
      server.runOnce(10);
    }
    LOG(INFO) << "Received termination signal, shutting down";
    server.stop();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    STERROR << "pvserver failed: " << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
