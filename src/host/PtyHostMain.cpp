#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "PtyHost.hpp"
#include "PvConfig.hpp"
#include "RawSocketUtils.hpp"

using namespace pv;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  pv::HandleTerminate();

  ::signal(SIGTERM, PtyHost::requestTerminate);
  ::signal(SIGINT, PtyHost::requestTerminate);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("pvhost", "Isolated terminal host process");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("fd", "Connected socket shared with the manager",
         cxxopts::value<int>())  //
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
      CLOG(INFO, "stdout") << "pvhost version " << PV_VERSION << endl;
      exit(0);
    }
    if (!result.count("fd")) {
      CLOG(INFO, "stdout") << "Missing --fd" << endl
                           << options.help({}) << endl;
      exit(1);
    }

    string cfgfile = result["cfgfile"].as<string>();
    PvConfig config =
        PvConfig::load(cfgfile.empty() ? PvConfig::defaultPath() : cfgfile);

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
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "pvhost",
                              result.count("logtostdout") > 0,
                              !result.count("logtostdout"), true,
                              config.maxLogSize);
    LogHandler::activate(defaultConf, "pvhost-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (-1 == sodium_init()) {
      STFATAL << "libsodium init failed";
    }

    int channelFd = result["fd"].as<int>();
    RawSocketUtils::setCloseOnExec(channelFd);
    shared_ptr<PipeSocketHandler> socketHandler(new PipeSocketHandler());
    socketHandler->adoptSocket(channelFd);

    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
    shared_ptr<BackendDetector> detector(new BackendDetector(
        shared_ptr<PlatformProbe>(new SystemPlatformProbe(subprocessUtils))));
    shared_ptr<TerminalFactory> terminalFactory(new TerminalFactory(detector));

    LOG(INFO) << "PTY host " << getpid() << " starting on fd " << channelFd;
    PtyHost host(socketHandler, channelFd, terminalFactory, config.host);
    host.run();
    socketHandler->close(channelFd);
    LOG(INFO) << "PTY host shutting down";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    STERROR << "PTY host failed: " << re.what();
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
