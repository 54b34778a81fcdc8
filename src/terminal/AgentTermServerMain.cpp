#include <cxxopts.hpp>

#include "AgentCatalog.hpp"
#include "DaemonCreator.hpp"
#include "ForkPtyTerminal.hpp"
#include "LogHandler.hpp"
#include "ModelSettings.hpp"
#include "SessionRegistry.hpp"
#include "SimpleIni.h"
#include "StatusServer.hpp"
#include "TerminalConnectionHandler.hpp"
#include "WebSocketServer.hpp"

using namespace agt;

namespace {
volatile sig_atomic_t stopRequested = 0;

void requestStop(int) { stopRequested = 1; }

string absolutePath(const string& path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  return ec ? path : absolute.lexically_normal().string();
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  agt::HandleTerminate();

  cxxopts::Options options("agentterm-server",
                           "Browser terminals for command-line coding agents");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "WebSocket port to listen on",
         cxxopts::value<int>()->default_value("8000"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("statusport", "HTTP status port, 0 to disable",
         cxxopts::value<int>()->default_value("8001"))  //
        ("projectsdir", "Parent directory of the project working directories",
         cxxopts::value<string>()->default_value("./projects"))  //
        ("settings", "Settings JSON file with the model configuration",
         cxxopts::value<string>()->default_value("./settings.json"))  //
        ("daemon", "Daemonize the server")                              //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "agentterm"))  //
        ("pidfile", "Location of the pid file",
         cxxopts::value<std::string>()->default_value(
             "/var/run/agentterm.pid"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("nokickoff", "Never type the kickoff prompt into new agents")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "agentterm version " << AGT_VERSION << endl;
      exit(0);
    }

    int port = result["port"].as<int>();
    int statusPort = result["statusport"].as<int>();
    string bindIp = result["bindip"].as<string>();
    string projectsDir = result["projectsdir"].as<string>();
    string settingsFile = result["settings"].as<string>();
    string logDir = result["logdir"].as<string>();
    HandlerOptions handlerOptions;
    LogSettings logSettings;

    if (result.count("cfgfile")) {
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc < 0) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }

      if (!result.count("port")) {
        port = int(ini.GetLongValue("Networking", "port", port));
      }
      if (!result.count("bindip")) {
        bindIp = ini.GetValue("Networking", "bind_ip", bindIp.c_str());
      }
      if (!result.count("statusport")) {
        statusPort =
            int(ini.GetLongValue("Networking", "status_port", statusPort));
      }
      if (!result.count("projectsdir")) {
        projectsDir =
            ini.GetValue("Paths", "projects_dir", projectsDir.c_str());
      }
      if (!result.count("settings")) {
        settingsFile =
            ini.GetValue("Paths", "settings_file", settingsFile.c_str());
      }

      handlerOptions.kickoffEnabled =
          ini.GetBoolValue("Session", "kickoff", handlerOptions.kickoffEnabled);
      handlerOptions.kickoffDelayMs = int(ini.GetLongValue(
          "Session", "kickoff_delay_ms", handlerOptions.kickoffDelayMs));
      handlerOptions.kickoffSettleMs = int(ini.GetLongValue(
          "Session", "kickoff_settle_ms", handlerOptions.kickoffSettleMs));

      // read verbose level (prioritize command line option over cfgfile)
      const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
      if (!result.count("verbose") && vlevel) {
        el::Loggers::setVerboseLevel(atoi(vlevel));
      }
      // read silent setting
      const char* silent = ini.GetValue("Debug", "silent", NULL);
      if (silent && atoi(silent) != 0) {
        defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
      }
      // read log file size limit
      const char* logsize = ini.GetValue("Debug", "logsize", NULL);
      if (logsize && atoi(logsize) != 0) {
        logSettings.maxLogSize = string(logsize);
      }
      if (!result.count("logdir")) {
        logDir = ini.GetValue("Debug", "logdir", logDir.c_str());
      }
    }

    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    }
    if (result.count("nokickoff")) {
      handlerOptions.kickoffEnabled = false;
    }

    // The daemon runs from /, so pin every path first
    projectsDir = absolutePath(projectsDir);
    settingsFile = absolutePath(settingsFile);
    logDir = absolutePath(logDir);
    handlerOptions.projectsDir = projectsDir;

    if (result.count("daemon")) {
      DaemonCreator::create(true, result["pidfile"].as<string>());
    }

    logSettings.directory = logDir;
    logSettings.toStdout = result.count("logtostdout") > 0;
    logSettings.redirectStderr = !logSettings.toStdout;
    LogHandler::setupLogFiles(&defaultConf, logSettings);
    // Reconfigure default logger to apply settings above
    LogHandler::apply(defaultConf);
    LogHandler::setThreadName("agentterm-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    // Client disconnects must not kill the server
    ::signal(SIGPIPE, SIG_IGN);
    ::signal(SIGINT, requestStop);
    ::signal(SIGTERM, requestStop);

    std::error_code ec;
    fs::create_directories(projectsDir, ec);
    if (ec) {
      STFATAL << "Cannot create projects directory " << projectsDir << ": "
              << ec.message();
    }

    LOG(INFO) << "Starting agentterm " << AGT_VERSION << " (projects in "
              << projectsDir << ", settings from " << settingsFile << ")";

    shared_ptr<AgentCatalog> catalog(new AgentCatalog());
    shared_ptr<SessionRegistry> registry(
        new SessionRegistry(catalog, []() {
          return shared_ptr<PseudoTerminal>(new ForkPtyTerminal());
        }));
    shared_ptr<ModelSettings> modelSettings(new ModelSettings(settingsFile));
    shared_ptr<TerminalConnectionHandler> connectionHandler(
        new TerminalConnectionHandler(registry, modelSettings,
                                      handlerOptions));

    WebSocketServer webSocketServer(
        bindIp, port,
        [connectionHandler](shared_ptr<WebSocketConnection> connection,
                            const string& projectId, const string& agent) {
          connectionHandler->run(connection, projectId, agent);
        });
    unique_ptr<StatusServer> statusServer;
    try {
      webSocketServer.start();
      if (statusPort > 0) {
        statusServer.reset(new StatusServer(registry, bindIp, statusPort));
        statusServer->start();
      }
    } catch (const std::runtime_error& re) {
      CLOG(INFO, "stdout") << re.what() << endl;
      STFATAL << "Server startup failed: " << re.what();
    }

    while (!stopRequested) {
      sleepMs(100);
    }

    LOG(INFO) << "Shutting down";
    if (statusServer) {
      statusServer->stop();
    }
    webSocketServer.stop();
    registry->shutdown();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
