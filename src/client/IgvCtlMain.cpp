#include <cxxopts.hpp>

#include "ClientConfig.hpp"
#include "IgvSession.hpp"
#include "LogHandler.hpp"
#include "TcpSocketHandler.hpp"

using namespace igv;

namespace {
// Splits one batch line into the command name and its arguments.
optional<string> sendBatchLine(IgvSession& session, const string& rawLine) {
  vector<CommandArg> args;
  string name;
  stringstream ss(rawLine);
  string token;
  while (ss >> token) {
    if (name.empty()) {
      name = token;
    } else {
      args.push_back(token);
    }
  }
  if ((name == "exit" || name == "quit") && args.empty()) {
    // Also drops our end of the socket
    return session.exit();
  }
  return session.send(name, args);
}

void printResponse(const optional<string>& response) {
  if (response) {
    CLOG(INFO, "stdout") << *response;
  } else {
    CLOG(INFO, "stdout") << "(no response)";
  }
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  igv::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, igv::InterruptSignalHandler);

  cxxopts::Options options("igvctl",
                           "Send batch commands to a genome viewer");
  try {
    options.positional_help("[command ...]");
    options.custom_help(
        "[OPTION...] [command ...]\n\n"
        "  Each command is one batch line, e.g. \"goto chr1\". With no\n"
        "  commands, batch lines are read from stdin.");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Host the viewer listens on",
         cxxopts::value<string>())  //
        ("p,port", "Batch port of the viewer",
         cxxopts::value<int>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<string>()->default_value(""))  //
        ("start", "Launch a fresh viewer instead of attaching")  //
        ("command", "Viewer executable used with --start",
         cxxopts::value<string>())  //
        ("snapshot-dir", "Directory snapshots are written to",
         cxxopts::value<string>())  //
        ("connect-timeout", "Connect timeout in milliseconds (0 = none)",
         cxxopts::value<int>())  //
        ("response-timeout",
         "Milliseconds to wait for each response (0 = forever)",
         cxxopts::value<int>())  //
        ("ready-timeout",
         "Seconds to wait for a started viewer to listen (0 = forever)",
         cxxopts::value<int>())  //
        ("kill", "Terminate the started viewer once all commands ran")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>(), "LEVEL")  //
        ("logtostdout", "Write log to stdout")  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<string>()->default_value(tmpDir))  //
        ("commands", "Batch command lines",
         cxxopts::value<vector<string>>());

    options.parse_positional({"commands"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "igvctl version " << IGV_VERSION << endl;
      exit(0);
    }

    ClientConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      loadConfigFile(cfgfilename, &config);
    }
    // Command line wins over the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
      validatePort(config.port);
    }
    if (result.count("command")) {
      config.command = result["command"].as<string>();
    }
    if (result.count("snapshot-dir")) {
      config.snapshotDir = result["snapshot-dir"].as<string>();
    }
    if (result.count("connect-timeout")) {
      config.connectTimeoutMs = result["connect-timeout"].as<int>();
    }
    if (result.count("response-timeout")) {
      config.responseTimeoutMs = result["response-timeout"].as<int>();
    }
    if (result.count("ready-timeout")) {
      config.readyTimeoutSeconds = result["ready-timeout"].as<int>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "igvctl", result.count("logtostdout") > 0,
                              true);
    el::Loggers::reconfigureLogger("default", defaultConf);

    auto socketHandler = make_shared<TcpSocketHandler>(config.responseTimeoutMs);
    shared_ptr<IgvSession> session;
    if (result.count("start")) {
      auto launcher =
          make_shared<IgvLauncher>(make_shared<SubprocessUtils>());
      session = IgvSession::start(config, launcher, socketHandler);
    } else {
      session = IgvSession::open(config, socketHandler);
    }

    if (result.count("commands")) {
      for (const auto& line : result["commands"].as<vector<string>>()) {
        printResponse(sendBatchLine(*session, line));
        if (session->isClosed()) {
          break;
        }
      }
    } else {
      string line;
      while (!session->isClosed() && std::getline(std::cin, line)) {
        string batchLine = trim(line);
        if (batchLine.empty() || batchLine[0] == '#') {
          continue;
        }
        printResponse(sendBatchLine(*session, batchLine));
      }
    }

    if (result.count("kill")) {
      session->kill();
    } else {
      session->close();
    }
  } catch (const cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const IgvError& err) {
    LOG(ERROR) << err.what();
    CLOG(INFO, "stdout") << "Error: " << err.what() << endl;
    exit(1);
  }
  return 0;
}
